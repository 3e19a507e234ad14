/***
 * Name: proofc::driver::Execute
 * Purpose: Classify inputs and run the pipeline with the given collaborators.
 * Inputs: opts, toolchain, native toolchain, printer
 * Outputs: ExitStatus for the whole invocation
 * Theory of Operation: Builds the sinks (console sink, realigning adapter for the
 *   proof engine) and the PipelineContext, then hands over to pipeline::Run.
 */
#include "proofc/driver/app.h"

#include <vector>

#include "proofc/diag/console_sink.h"
#include "proofc/diag/realigning_sink.h"
#include "proofc/pipeline/context.h"
#include "proofc/pipeline/controller.h"

namespace proofc::driver {

auto Execute(const CliOptions& opts, toolchain::Toolchain& toolchain, backend::NativeToolchain& native,
             diag::Printer& printer) -> pipeline::ExitStatus {
  std::vector<pipeline::SourceDescriptor> programs;
  std::vector<pipeline::SourceDescriptor> others;
  if (!ClassifyInputs(opts.inputs, programs, others, printer, opts.pipeline.verify_snapshots >= 0)) {
    return pipeline::ExitStatus::PreprocessingError;
  }
  if (programs.empty()) {
    printer.ErrorWriteLine("*** Error: No proof program (.prf) files were specified.");
    return pipeline::ExitStatus::PreprocessingError;
  }

  diag::ConsoleSink console(printer);
  diag::RealigningSink engine_sink(console);
  const pipeline::PipelineContext ctx{opts.pipeline, toolchain, native, printer, console, engine_sink};
  return pipeline::Run(programs, others, ctx);
}

}  // namespace proofc::driver
