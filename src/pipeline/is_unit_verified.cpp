/***
 * Name: proofc::pipeline::IsUnitVerified
 * Purpose: Unit-level verdict.
 * Inputs: outcome, stats
 * Outputs: true iff outcome is Done or VerificationCompleted and no fresh error,
 *   inconclusive, timeout or out-of-memory result was recorded
 */
#include "proofc/pipeline/verification_runner.h"

namespace proofc::pipeline {

auto IsUnitVerified(PipelineOutcome outcome, const PipelineStatistics& stats) -> bool {
  const bool finished = outcome == PipelineOutcome::Done || outcome == PipelineOutcome::VerificationCompleted;
  return finished && !stats.HasFailures();
}

}  // namespace proofc::pipeline
