/***
 * Name: proofc::pipeline::MergeOutcome
 * Purpose: Fold one unit outcome into a file's running outcome (first distinct wins).
 * Inputs: current running outcome, next unit outcome
 * Outputs: New running outcome
 */
#include "proofc/pipeline/outcome.h"

namespace proofc::pipeline {

auto MergeOutcome(PipelineOutcome current, PipelineOutcome next) -> PipelineOutcome {
  const bool still_clean =
      current == PipelineOutcome::VerificationCompleted || current == PipelineOutcome::Done;
  if (still_clean && next != PipelineOutcome::VerificationCompleted) {
    return next;
  }
  return current;
}

}  // namespace proofc::pipeline
