/***
 * Name: proofc::codegen::Dispatcher::Dispatch
 * Purpose: Report the file's statistics and run code generation per policy.
 * Inputs: aggregate outcome, per-unit statistics, program, verdict, file name, native files
 * Outputs: CompileResult (NotRequested when nothing is generated)
 */
#include "proofc/codegen/dispatcher.h"

#include <map>
#include <string>
#include <vector>

#include "proofc/pipeline/result_aggregator.h"

namespace proofc::codegen {

auto Dispatcher::Dispatch(pipeline::PipelineOutcome outcome,
                          const std::map<std::string, pipeline::PipelineStatistics>& per_unit,
                          toolchain::Program& program, bool verified, const std::string& file_name,
                          const std::vector<pipeline::SourceDescriptor>& other_files) -> CompileResult {
  if (outcome != pipeline::PipelineOutcome::VerificationCompleted && outcome != pipeline::PipelineOutcome::Done) {
    return CompileResult{};
  }
  ctx_.printer.WriteTrailer(pipeline::SumStatistics(per_unit));

  switch (SelectGenerationMode(outcome, verified, ctx_.config)) {
    case GenerationMode::GenerateAndBuild:
      return CompileProgram(program, file_name, other_files, true);
    case GenerationMode::SpillOnly:
      return CompileProgram(program, file_name, other_files, false);
    case GenerationMode::Skip:
      break;
  }
  return CompileResult{};
}

}  // namespace proofc::codegen
