/***
 * Name: proofc::pipeline::ClassifyResult
 * Purpose: Exit status of one program from its verdict and compile result.
 */
#include "proofc/pipeline/controller.h"

namespace proofc::pipeline {

auto ClassifyResult(bool verified, bool build_ok, bool output_error) -> ExitStatus {
  if (!verified) {
    return ExitStatus::NotVerified;
  }
  if (build_ok) {
    return ExitStatus::Verified;
  }
  return output_error ? ExitStatus::CompileOutputError : ExitStatus::CompileError;
}

}  // namespace proofc::pipeline
