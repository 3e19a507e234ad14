/***
 * Name: proofc::pipeline::ProcessProgram
 * Purpose: Front end, translation, verification and code generation for one program.
 * Inputs: program files (at least one), native files, context, program id
 * Outputs: ExitStatus
 * Theory of Operation:
 *   1) ParseCheck; a front-end error ends the run with CompileError.
 *   2) Unless verification is disabled: translate, verify every unit (dump names
 *      derive from the last file), dispatch code generation on the first file.
 *   3) Optional program statistics and call graph.
 */
#include <optional>
#include <string>
#include <vector>

#include "proofc/codegen/dispatcher.h"
#include "proofc/exceptions/pipeline_error.h"
#include "proofc/pipeline/controller.h"
#include "proofc/pipeline/result_aggregator.h"
#include "proofc/support/fs.h"

namespace proofc::pipeline {

auto ProcessProgram(const std::vector<SourceDescriptor>& files, const std::vector<SourceDescriptor>& other_files,
                    const PipelineContext& ctx, const std::optional<std::string>& program_id) -> ExitStatus {
  if (files.empty()) {
    throw exceptions::PipelineError("no program files to process");
  }
  const auto& config = ctx.config;
  const std::vector<std::string> names = Paths(files);
  const std::string program_name = names.size() == 1 ? names.front() : "the program";

  auto& frontend = ctx.toolchain.GetFrontend();
  toolchain::ParseCheckResult parsed = frontend.ParseCheck(files, program_name, ctx.reporter);
  if (parsed.error) {
    ctx.printer.ErrorWriteLine(*parsed.error);
    return ExitStatus::CompileError;
  }
  if (!parsed.program) {
    return ExitStatus::Verified;
  }

  ExitStatus status = ExitStatus::Verified;
  if (!config.no_resolve && !config.no_typecheck && config.verify) {
    std::vector<toolchain::VcUnit> units = TranslateProgram(*parsed.program, ctx);
    const std::string base_name = support::FileName(names.back());
    const AggregateResult agg = VerifyUnits(units, base_name, program_id, ctx);

    codegen::Dispatcher dispatcher(ctx);
    const std::string file_name = config.print_compiled_file.value_or(names.front());
    const codegen::CompileResult compiled =
        dispatcher.Dispatch(agg.outcome, agg.per_unit, *parsed.program, agg.verified, file_name, other_files);
    status = ClassifyResult(agg.verified, compiled.BuildSucceeded(),
                            compiled.status == codegen::CompileStatus::OutputError);
  }

  if (config.print_stats) {
    frontend.PrintStats(*parsed.program, ctx.printer.Out());
  }
  if (config.print_function_call_graph) {
    frontend.PrintFunctionCallGraph(*parsed.program, ctx.printer.Out());
  }
  return status;
}

}  // namespace proofc::pipeline
