/***
 * Name: proofc::pipeline::PipelineStatistics::operator+= / operator+
 * Purpose: Field-wise sum of verification statistics (fresh and cached counters).
 */
#include "proofc/pipeline/outcome.h"

namespace proofc::pipeline {

auto PipelineStatistics::operator+=(const PipelineStatistics& other) -> PipelineStatistics& {
  verified += other.verified;
  errors += other.errors;
  inconclusive += other.inconclusive;
  timeouts += other.timeouts;
  out_of_memory += other.out_of_memory;
  cached_verified += other.cached_verified;
  cached_errors += other.cached_errors;
  cached_inconclusive += other.cached_inconclusive;
  cached_timeouts += other.cached_timeouts;
  cached_out_of_memory += other.cached_out_of_memory;
  return *this;
}

auto operator+(PipelineStatistics lhs, const PipelineStatistics& rhs) -> PipelineStatistics {
  lhs += rhs;
  return lhs;
}

}  // namespace proofc::pipeline
