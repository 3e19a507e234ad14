/***
 * Name: proofc::codegen::SelectGenerationMode
 * Purpose: Whether to generate code after verification, and whether to build it.
 * Inputs: aggregate outcome, verdict, configuration
 * Outputs: GenerationMode
 * Theory of Operation:
 *   VerificationCompleted: build when compiling a fully verified program (no
 *     procedure filter) or when forced; spill at level 2 for such a program,
 *     always at level 3.
 *   Done (nothing to verify): build only when forced; spill only at level 3.
 *   Anything else was already reported as an error.
 */
#include "proofc/codegen/dispatcher.h"

namespace proofc::codegen {

auto SelectGenerationMode(pipeline::PipelineOutcome outcome, bool verified, const pipeline::Config& config)
    -> GenerationMode {
  constexpr int kSpillVerified = 2;
  constexpr int kSpillAlways = 3;
  const bool whole_program = config.procs_to_check.empty();

  switch (outcome) {
    case pipeline::PipelineOutcome::VerificationCompleted:
      if ((config.compile && verified && whole_program) || config.force_compile) {
        return GenerationMode::GenerateAndBuild;
      }
      if ((config.spill_target_code >= kSpillVerified && verified && whole_program) ||
          config.spill_target_code >= kSpillAlways) {
        return GenerationMode::SpillOnly;
      }
      return GenerationMode::Skip;
    case pipeline::PipelineOutcome::Done:
      if (config.force_compile) {
        return GenerationMode::GenerateAndBuild;
      }
      return config.spill_target_code >= kSpillAlways ? GenerationMode::SpillOnly : GenerationMode::Skip;
    default:
      return GenerationMode::Skip;
  }
}

}  // namespace proofc::codegen
