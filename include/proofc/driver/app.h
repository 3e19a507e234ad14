/***
 * Name: proofc::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options, classified inputs, collaborators
 * Outputs: Exit statuses and process exit codes
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units; adhere to one function per .cpp file.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "proofc/backend/native_toolchain.h"
#include "proofc/diag/printer.h"
#include "proofc/driver/cli.h"
#include "proofc/pipeline/outcome.h"
#include "proofc/pipeline/source.h"
#include "proofc/toolchain/toolchain.h"

namespace proofc {
namespace driver {

/***
 * Name: proofc::driver::ClassifyInputs
 * Purpose: Split raw inputs into proof programs and auxiliary native files.
 * Inputs: inputs, printer (for errors), snapshots (snapshot lookup enabled)
 * Outputs: programs, others; false (error printed) on an unsupported or missing input
 * Theory of Operation: Extension based; proof programs must exist on disk. With
 *   snapshots, a missing program is accepted when its version 0 snapshot exists.
 */
bool ClassifyInputs(const std::vector<std::string>& inputs,
                    std::vector<pipeline::SourceDescriptor>& programs,
                    std::vector<pipeline::SourceDescriptor>& others,
                    diag::Printer& printer,
                    bool snapshots = false);

/*** MapExitCode: Process exit code for status under the error-counting policy. */
int MapExitCode(pipeline::ExitStatus status, bool count_verification_errors);

/***
 * Name: proofc::driver::RunOnLargeStack
 * Purpose: Run body on a dedicated thread with an explicit stack budget.
 * Inputs: stack_size in bytes, body
 * Outputs: body's return value
 * Theory of Operation: pthread attributes carry the stack size; exceptions thrown by
 *   body are captured and rethrown on the calling thread. Throws BackendError when
 *   the thread cannot be created.
 */
int RunOnLargeStack(std::size_t stack_size, const std::function<int()>& body);

/***
 * Name: proofc::driver::Execute
 * Purpose: Classify inputs and run the pipeline with the given collaborators.
 * Inputs: opts, toolchain, native toolchain, printer
 * Outputs: ExitStatus for the whole invocation
 */
pipeline::ExitStatus Execute(const CliOptions& opts, toolchain::Toolchain& toolchain,
                             backend::NativeToolchain& native, diag::Printer& printer);

/***
 * Name: proofc::driver::ThreadMain
 * Purpose: Body of the worker thread: preprocessing checks, plugin load, Execute.
 * Inputs: opts, out/err streams
 * Outputs: ExitStatus (PreprocessingError for every failure before the pipeline)
 */
pipeline::ExitStatus ThreadMain(const CliOptions& opts, std::ostream& out, std::ostream& err);

/***
 * Name: proofc::driver::Main
 * Purpose: Whole-process entry: parse, run on the large stack, map the exit code.
 * Inputs: argc/argv, out/err streams
 * Outputs: Process exit code
 */
int Main(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

/*** ReportMetricsIfRequested: Emit metrics in the requested format if enabled. */
void ReportMetricsIfRequested(const CliOptions& opts, std::ostream& out);

/*** DefaultRuntimeLibDir: Directory containing the running proofc binary. */
std::string DefaultRuntimeLibDir();

/*** VersionString: "proofc <version>". */
std::string VersionString();

}  // namespace driver
}  // namespace proofc
