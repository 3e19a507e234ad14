/***
 * Name: proofc::pipeline (outcome)
 * Purpose: Stage outcome, statistics and exit status types shared by the pipeline.
 * Inputs: N/A (declarations only)
 * Outputs: PipelineOutcome, PipelineStatistics, ExitStatus and their merge helpers
 * Theory of Operation: Statistics are plain counters summed field-wise; the two
 *   merge helpers encode the outcome and exit-status combination rules.
 */
#pragma once

#include <cstdint>

namespace proofc {
namespace pipeline {

enum class PipelineOutcome {
  Done,
  ResolutionError,
  TypeCheckingError,
  ResolvedAndTypeChecked,
  VerificationCompleted,
};

enum class ExitStatus {
  Verified = 0,
  PreprocessingError = 1,
  CompileError = 2,
  NotVerified = 3,
  CompileOutputError = 4,
};

struct PipelineStatistics {
  std::uint64_t verified{0};
  std::uint64_t errors{0};
  std::uint64_t inconclusive{0};
  std::uint64_t timeouts{0};
  std::uint64_t out_of_memory{0};
  std::uint64_t cached_verified{0};
  std::uint64_t cached_errors{0};
  std::uint64_t cached_inconclusive{0};
  std::uint64_t cached_timeouts{0};
  std::uint64_t cached_out_of_memory{0};

  PipelineStatistics& operator+=(const PipelineStatistics& other);
  bool operator==(const PipelineStatistics& other) const = default;

  /*** HasFailures: Any fresh error, inconclusive, timeout or out-of-memory count. */
  [[nodiscard]] bool HasFailures() const;
  [[nodiscard]] bool HasCached() const;
};

PipelineStatistics operator+(PipelineStatistics lhs, const PipelineStatistics& rhs);

const char* OutcomeName(PipelineOutcome outcome);
const char* ExitStatusName(ExitStatus status);

/***
 * Name: proofc::pipeline::MergeOutcome
 * Purpose: Fold one unit outcome into the running outcome of a file.
 * Theory of Operation: While the running value is VerificationCompleted or Done,
 *   any outcome other than VerificationCompleted replaces it; after that the first
 *   replacement sticks (first distinct wins).
 */
PipelineOutcome MergeOutcome(PipelineOutcome current, PipelineOutcome next);

/***
 * Name: proofc::pipeline::MergeExitStatus
 * Purpose: Fold one file/snapshot-group status into the running status.
 * Theory of Operation: A non-Verified status different from the running value
 *   replaces it (last distinct wins); Verified never replaces anything. This is
 *   the opposite direction from MergeOutcome and both are relied upon.
 */
ExitStatus MergeExitStatus(ExitStatus current, ExitStatus next);

}  // namespace pipeline
}  // namespace proofc
