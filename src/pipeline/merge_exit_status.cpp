/***
 * Name: proofc::pipeline::MergeExitStatus
 * Purpose: Fold one file or snapshot-group status into the running status
 *   (last distinct non-Verified wins).
 * Inputs: current running status, next status
 * Outputs: New running status
 */
#include "proofc/pipeline/outcome.h"

namespace proofc::pipeline {

auto MergeExitStatus(ExitStatus current, ExitStatus next) -> ExitStatus {
  if (current != next && next != ExitStatus::Verified) {
    return next;
  }
  return current;
}

}  // namespace proofc::pipeline
