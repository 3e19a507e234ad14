/***
 * Name: proofc::pipeline::PipelineStatistics::HasFailures / HasCached
 * Purpose: Predicates over statistics used by the verdict and the trailer.
 * Theory of Operation: Each failure kind is its own counter; any of them being
 *   non-zero is a failure, and none of them is folded into another.
 */
#include "proofc/pipeline/outcome.h"

namespace proofc::pipeline {

auto PipelineStatistics::HasFailures() const -> bool {
  return errors != 0U || inconclusive != 0U || timeouts != 0U || out_of_memory != 0U;
}

auto PipelineStatistics::HasCached() const -> bool {
  return cached_verified != 0U || cached_errors != 0U || cached_inconclusive != 0U ||
         cached_timeouts != 0U || cached_out_of_memory != 0U;
}

}  // namespace proofc::pipeline
