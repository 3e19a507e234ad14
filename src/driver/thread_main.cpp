/***
 * Name: proofc::driver::ThreadMain
 * Purpose: Body of the worker thread.
 * Inputs: opts, out/err streams
 * Outputs: ExitStatus
 * Theory of Operation:
 *   1) Preprocessing checks: inputs present, diagnostic log opens.
 *   2) Banner and --show-env echo, then the plugin load.
 *   3) Default the runtime library directory and run Execute with clang.
 */
#include "proofc/driver/app.h"

#include <fstream>
#include <memory>
#include <ostream>
#include <string>

#include "proofc/backend/native_toolchain.h"
#include "proofc/exceptions/toolchain_error.h"
#include "proofc/plugin/toolchain_plugin.h"

namespace proofc::driver {

auto ThreadMain(const CliOptions& opts, std::ostream& out, std::ostream& err) -> pipeline::ExitStatus {
  diag::Printer printer(out, err);
  if (opts.inputs.empty()) {
    printer.ErrorWriteLine("*** Error: No input files were specified.");
    return pipeline::ExitStatus::PreprocessingError;
  }

  std::ofstream diag_log;
  if (!opts.diag_log.empty()) {
    diag_log.open(opts.diag_log);
    if (!diag_log) {
      printer.ErrorWriteLine("*** Error: cannot open diagnostic log '" + opts.diag_log + "'");
      return pipeline::ExitStatus::PreprocessingError;
    }
    printer.SetMirror(&diag_log);
  }

  if (!opts.no_logo) {
    printer.AdvisoryWriteLine(VersionString());
  }
  if (opts.show_env) {
    std::string line = "Command Line Options:";
    for (const auto& arg : opts.args) {
      line += " " + arg;
    }
    printer.WriteLine(line);
  }

  const std::string plugin_path = plugin::ResolveToolchainPath(opts.toolchain_path);
  if (plugin_path.empty()) {
    printer.ErrorWriteLine(std::string("*** Error: no toolchain plugin given (use --toolchain=<plugin> or set ") +
                           PROOFC_TOOLCHAIN_ENV + ")");
    return pipeline::ExitStatus::PreprocessingError;
  }
  std::unique_ptr<plugin::LoadedToolchain> loaded;
  try {
    loaded = plugin::LoadToolchain(plugin_path);
  } catch (const exceptions::ToolchainError& e) {
    printer.ErrorWriteLine(std::string("*** Error: ") + e.what());
    return pipeline::ExitStatus::PreprocessingError;
  }

  CliOptions effective = opts;
  if (effective.pipeline.runtime_lib_dir.empty()) {
    effective.pipeline.runtime_lib_dir = DefaultRuntimeLibDir();
  }
  backend::ClangToolchain native(effective.pipeline.cxx);
  const pipeline::ExitStatus status = Execute(effective, loaded->Get(), native, printer);
  printer.SetMirror(nullptr);
  return status;
}

}  // namespace proofc::driver
