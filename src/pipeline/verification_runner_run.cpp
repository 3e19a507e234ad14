/***
 * Name: proofc::pipeline::VerificationRunner::Run
 * Purpose: Verify one VC-unit and compute its verdict.
 * Inputs:
 *   - unit: VC-unit whose program is consumed (released after verification)
 *   - base_file_name: file name used to derive the dump path
 *   - program_id: cache key prefix (file path in separate mode)
 * Outputs: UnitResult
 */
#include <optional>
#include <string>

#include "proofc/exceptions/pipeline_error.h"
#include "proofc/pipeline/verification_runner.h"

namespace proofc::pipeline {

auto VerificationRunner::Run(toolchain::VcUnit& unit, const std::string& base_file_name,
                             const std::optional<std::string>& program_id) -> UnitResult {
  if (!unit.program) {
    throw exceptions::PipelineError("verification unit '" + unit.name + "' has no program");
  }
  const std::string artifact_path = ArtifactPathFor(base_file_name, unit.name, ctx_.config);
  std::optional<std::string> cache_id;
  if (ctx_.config.verify_snapshots > 1) {
    cache_id = ProgramIdFor(program_id, unit.name);
  }

  const toolchain::VerifyResult verified = RunWithRerun(*unit.program, artifact_path, cache_id);
  unit.program.reset();

  UnitResult result;
  result.name = unit.name;
  result.outcome = verified.outcome;
  result.stats = verified.stats;
  result.verified = IsUnitVerified(result.outcome, result.stats);
  IncCounter(result.verified ? "units.verified" : "units.failed");
  return result;
}

auto RunUnit(toolchain::VcUnit& unit, const std::string& base_file_name,
             const std::optional<std::string>& program_id, const PipelineContext& ctx) -> UnitResult {
  VerificationRunner runner(ctx);
  return runner.Run(unit, base_file_name, program_id);
}

}  // namespace proofc::pipeline
