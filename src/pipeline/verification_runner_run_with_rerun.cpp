/***
 * Name: proofc::pipeline::VerificationRunner::RunWithRerun
 * Purpose: Resolve/typecheck a VC program, then optimize and solve it.
 * Inputs: program, dump path (for the diagnostic re-run), optional cache id
 * Outputs: Outcome and statistics of the unit
 * Theory of Operation:
 *   Done                      -> Done, empty statistics
 *   ResolutionError/TypeError -> diagnostic re-run, outcome of the first check
 *   ResolvedAndTypeChecked    -> dead variables, mod sets, coalesce, inline, solve
 */
#include <optional>
#include <string>

#include "proofc/exceptions/pipeline_error.h"
#include "proofc/pipeline/verification_runner.h"

namespace proofc::pipeline {

auto VerificationRunner::RunWithRerun(toolchain::VcProgram& program, const std::string& artifact_path,
                                      const std::optional<std::string>& cache_id) -> toolchain::VerifyResult {
  auto& engine = ctx_.toolchain.GetProofEngine();
  toolchain::VerifyResult result;

  PipelineOutcome checked = PipelineOutcome::Done;
  {
    const ScopedTimer timer(Phase::Resolve);
    checked = engine.ResolveAndTypecheck(program, artifact_path, ctx_.engine_sink);
  }

  switch (checked) {
    case PipelineOutcome::Done:
      result.outcome = PipelineOutcome::Done;
      return result;
    case PipelineOutcome::ResolutionError:
    case PipelineOutcome::TypeCheckingError:
      RerunForDiagnostics(program, artifact_path);
      result.outcome = checked;
      return result;
    case PipelineOutcome::ResolvedAndTypeChecked: {
      {
        const ScopedTimer timer(Phase::Optimize);
        engine.EliminateDeadVariables(program);
        engine.CollectModSets(program);
        engine.CoalesceBlocks(program);
        engine.Inline(program);
      }
      const ScopedTimer timer(Phase::Solve);
      return engine.InferAndVerify(program, cache_id, ctx_.engine_sink);
    }
    case PipelineOutcome::VerificationCompleted:
      break;
  }
  throw exceptions::PipelineError(std::string("proof engine returned ") + OutcomeName(checked) +
                                  " from resolve/typecheck");
}

}  // namespace proofc::pipeline
