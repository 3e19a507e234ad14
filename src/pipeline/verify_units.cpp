/***
 * Name: proofc::pipeline::VerifyUnits
 * Purpose: Verify every unit of one program in order and aggregate the results.
 * Inputs: units (programs consumed), base file name, program id, context
 * Outputs: AggregateResult
 * Theory of Operation: No early abort; a failing unit never prevents later units
 *   from running. With separate module output each unit is framed by its name,
 *   elapsed time and its own trailer.
 */
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "proofc/pipeline/result_aggregator.h"

namespace proofc::pipeline {

auto VerifyUnits(std::vector<toolchain::VcUnit>& units, const std::string& base_file_name,
                 const std::optional<std::string>& program_id, const PipelineContext& ctx) -> AggregateResult {
  AggregateResult agg;
  VerificationRunner runner(ctx);
  const bool per_module = ctx.config.separate_module_output;

  for (auto& unit : units) {
    if (per_module) {
      ctx.printer.AdvisoryWriteLine("For module: " + unit.name);
    }
    const auto start = std::chrono::steady_clock::now();
    const UnitResult result = runner.Run(unit, base_file_name, program_id);
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);

    Accumulate(agg, result);
    agg.timings.push_back(UnitTiming{result.name, elapsed});

    if (per_module) {
      ctx.printer.AdvisoryWriteLine("Elapsed time: " + FormatElapsed(elapsed));
      ctx.printer.WriteTrailer(result.stats);
    }
  }
  return agg;
}

}  // namespace proofc::pipeline
