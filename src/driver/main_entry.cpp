/***
 * Name: proofc::driver::Main
 * Purpose: Whole-process entry used by main().
 * Inputs: argc/argv, out/err streams
 * Outputs: Process exit code
 * Theory of Operation:
 *   1) Parse; bad options print usage and give the PreprocessingError code.
 *   2) Run ThreadMain on the large stack. A worker that cannot be set up
 *      (ConfigError, BackendError) gives the PreprocessingError code; other
 *      exceptions escaping it give the CompileError code.
 *   3) Metrics, then MapExitCode.
 */
#include "proofc/driver/app.h"

#include <exception>
#include <ostream>

#include "proofc/exceptions/backend_error.h"
#include "proofc/exceptions/config_error.h"
#include "proofc/exceptions/proofc_exception.h"
#include "proofc/metrics/metrics.h"

namespace proofc::driver {

auto Main(int argc, const char* const* argv, std::ostream& out, std::ostream& err) -> int {
  const char* argv0 = argc > 0 && argv != nullptr ? argv[0] : nullptr;
  CliOptions opts;
  if (!ParseCli(argc, argv, opts, err)) {
    PrintUsage(err, argv0);
    return MapExitCode(pipeline::ExitStatus::PreprocessingError, true);
  }
  if (opts.show_help) {
    PrintUsage(out, argv0);
    return 0;
  }

  metrics::Metrics::Reset();
  metrics::Metrics::Enable(opts.metrics);

  pipeline::ExitStatus status = pipeline::ExitStatus::Verified;
  try {
    status = static_cast<pipeline::ExitStatus>(
        RunOnLargeStack(opts.stack_size, [&]() { return static_cast<int>(ThreadMain(opts, out, err)); }));
  } catch (const exceptions::ConfigError& e) {
    err << "proofc: " << e.what() << '\n';
    status = pipeline::ExitStatus::PreprocessingError;
  } catch (const exceptions::BackendError& e) {
    err << "proofc: " << e.what() << '\n';
    status = pipeline::ExitStatus::PreprocessingError;
  } catch (const exceptions::ProofcException& e) {
    err << "proofc: " << e.what() << '\n';
    status = pipeline::ExitStatus::CompileError;
  } catch (const std::exception& e) {
    err << "proofc: internal error: " << e.what() << '\n';
    status = pipeline::ExitStatus::CompileError;
  }

  ReportMetricsIfRequested(opts, out);
  return MapExitCode(status, opts.pipeline.count_verification_errors);
}

}  // namespace proofc::driver
