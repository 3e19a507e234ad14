/***
 * Name: proofc::pipeline (result aggregator)
 * Purpose: Verify every unit of a program and combine the per-unit results.
 * Inputs: VcUnits, base file name, program id, context
 * Outputs: AggregateResult (overall verdict, worst outcome, per-unit statistics, timings)
 * Theory of Operation: Units run strictly in order with no early abort so every unit
 *   contributes diagnostics and statistics; the verdict is the AND of unit verdicts.
 */
#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "proofc/pipeline/context.h"
#include "proofc/pipeline/outcome.h"
#include "proofc/pipeline/verification_runner.h"
#include "proofc/toolchain/toolchain.h"

namespace proofc {
namespace pipeline {

struct UnitTiming {
  std::string name;
  std::chrono::nanoseconds elapsed{0};
};

struct AggregateResult {
  bool verified{true};
  PipelineOutcome outcome{PipelineOutcome::VerificationCompleted};
  std::map<std::string, PipelineStatistics> per_unit;
  std::vector<UnitTiming> timings;
};

/*** Accumulate: Fold one unit result into agg; duplicate unit names throw PipelineError. */
void Accumulate(AggregateResult& agg, const UnitResult& unit);

/*** SumStatistics: Field-wise sum over all units. */
PipelineStatistics SumStatistics(const std::map<std::string, PipelineStatistics>& per_unit);

/*** FormatElapsed: HH:MM:SS. */
std::string FormatElapsed(std::chrono::nanoseconds elapsed);

/*** VerifyUnits: Run every unit through the VerificationRunner and aggregate. */
AggregateResult VerifyUnits(std::vector<toolchain::VcUnit>& units, const std::string& base_file_name,
                            const std::optional<std::string>& program_id, const PipelineContext& ctx);

}  // namespace pipeline
}  // namespace proofc
