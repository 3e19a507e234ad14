/***
 * Name: proofc::pipeline::SumStatistics
 * Purpose: Total statistics of a file.
 */
#include <map>
#include <string>

#include "proofc/pipeline/result_aggregator.h"

namespace proofc::pipeline {

auto SumStatistics(const std::map<std::string, PipelineStatistics>& per_unit) -> PipelineStatistics {
  PipelineStatistics total;
  for (const auto& [name, stats] : per_unit) {
    total += stats;
  }
  return total;
}

}  // namespace proofc::pipeline
