/***
 * Name: proofc::pipeline::Accumulate
 * Purpose: Fold one unit result into the aggregate of a file.
 * Inputs: agg (updated in place), unit result
 * Outputs: None; throws PipelineError when the unit name was already recorded
 */
#include "proofc/exceptions/pipeline_error.h"
#include "proofc/pipeline/result_aggregator.h"

namespace proofc::pipeline {

void Accumulate(AggregateResult& agg, const UnitResult& unit) {
  if (!agg.per_unit.emplace(unit.name, unit.stats).second) {
    throw exceptions::PipelineError("duplicate verification unit '" + unit.name + "'");
  }
  agg.verified = agg.verified && unit.verified;
  agg.outcome = MergeOutcome(agg.outcome, unit.outcome);
}

}  // namespace proofc::pipeline
