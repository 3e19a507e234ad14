/***
 * Name: proofc::pipeline (verification runner)
 * Purpose: Drive one VC-unit through resolve/typecheck, the optimization passes and
 *   solving, with a diagnostic re-run when the translator produced a malformed unit.
 * Inputs: VcUnit, base input file name, optional program id, context
 * Outputs: UnitResult (outcome, statistics, verified predicate)
 * Theory of Operation: Resolution/type errors inside a VC-unit are translator defects;
 *   the unit is dumped, re-parsed from disk and re-checked so diagnostics point into
 *   the dump. The returned outcome is the one from the first check.
 */
#pragma once

#include <optional>
#include <string>

#include "proofc/metrics/metrics.h"
#include "proofc/pipeline/config.h"
#include "proofc/pipeline/context.h"
#include "proofc/pipeline/outcome.h"
#include "proofc/toolchain/toolchain.h"

namespace proofc {
namespace pipeline {

struct UnitResult {
  std::string name;
  PipelineOutcome outcome{PipelineOutcome::Done};
  PipelineStatistics stats;
  bool verified{false};
};

/*** IsUnitVerified: Done/VerificationCompleted with no fresh failure counts. */
bool IsUnitVerified(PipelineOutcome outcome, const PipelineStatistics& stats);

/*** SuffixedPath: <dir>/<stem>_<suffix><ext> for path. */
std::string SuffixedPath(const std::string& path, const std::string& suffix);

/*** ArtifactPathFor: Dump path of unit unit_name derived from base_file_name. */
std::string ArtifactPathFor(const std::string& base_file_name, const std::string& unit_name,
                            const Config& config);

/*** ProgramIdFor: Cache key for a unit; "main_program_id" when program_id is unset. */
std::string ProgramIdFor(const std::optional<std::string>& program_id, const std::string& unit_name);

class VerificationRunner : public metrics::Metrics {
 public:
  explicit VerificationRunner(const PipelineContext& ctx) : ctx_(ctx) {}

  /*** Run: Verify one unit; the unit's program is consumed. */
  UnitResult Run(toolchain::VcUnit& unit, const std::string& base_file_name,
                 const std::optional<std::string>& program_id);

 private:
  toolchain::VerifyResult RunWithRerun(toolchain::VcProgram& program, const std::string& artifact_path,
                                       const std::optional<std::string>& cache_id);
  void RerunForDiagnostics(toolchain::VcProgram& program, const std::string& artifact_path);

  const PipelineContext& ctx_;
};

/*** RunUnit: Convenience wrapper running one unit through a fresh VerificationRunner. */
UnitResult RunUnit(toolchain::VcUnit& unit, const std::string& base_file_name,
                   const std::optional<std::string>& program_id, const PipelineContext& ctx);

}  // namespace pipeline
}  // namespace proofc
