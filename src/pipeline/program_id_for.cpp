/***
 * Name: proofc::pipeline::ProgramIdFor
 * Purpose: Cache key of one unit for incremental re-verification.
 * Inputs: program_id (file path in separate mode, else unset), unit_name
 * Outputs: "<program_id>_<unit_name>", with "main_program_id" for an unset id
 */
#include "proofc/pipeline/verification_runner.h"

#include <optional>
#include <string>

namespace proofc::pipeline {

auto ProgramIdFor(const std::optional<std::string>& program_id, const std::string& unit_name) -> std::string {
  return program_id.value_or("main_program_id") + "_" + unit_name;
}

}  // namespace proofc::pipeline
