/***
 * Name: proofc::codegen::Dispatcher::BuildAndRun
 * Purpose: Natively build generated C++ and optionally run the result.
 * Inputs: generated source path, has_main, program name, native files
 * Outputs: CompileResult with the artifact path
 * Theory of Operation: Run-after builds into the temp dir. A non-zero exit of the
 *   program is reported but is not a fault; a signal or a failed launch is.
 */
#include "proofc/codegen/dispatcher.h"

#include <filesystem>
#include <string>
#include <vector>

#include "proofc/support/fs.h"

namespace proofc::codegen {

auto Dispatcher::BuildAndRun(const std::string& source_path, bool has_main, const std::string& program_name,
                             const std::vector<pipeline::SourceDescriptor>& other_files) -> CompileResult {
  const auto& config = ctx_.config;
  auto& printer = ctx_.printer;
  const backend::OutputKind kind = has_main ? backend::OutputKind::Executable : backend::OutputKind::Library;
  std::string output = ArtifactPath(program_name, kind);
  if (config.run_after_compile) {
    output = (std::filesystem::path(support::TempDir(config.dump_dir)) / support::FileName(output)).string();
  }
  const std::string shown = support::FileName(output);

  const backend::BuildRequest request = MakeBuildRequest(source_path, has_main, output, other_files, config);
  backend::BuildResult built;
  {
    const ScopedTimer timer(Phase::NativeBuild);
    built = ctx_.native.Build(request);
  }
  if (!built.ok) {
    printer.ErrorWriteLine("Errors compiling program into " + shown);
    for (const auto& error : built.errors) {
      printer.ErrorWriteLine(error);
      printer.ErrorWriteLine("");
    }
    return CompileResult{CompileStatus::BuildFailed, output};
  }
  IncCounter("native.builds");
  for (const auto& warning : built.warnings) {
    printer.ErrorWriteLine(warning);
  }

  if (config.run_after_compile) {
    if (!has_main) {
      return CompileResult{CompileStatus::Succeeded, output};
    }
    printer.WriteLine("Program compiled successfully");
    printer.WriteLine("Running...");
    printer.WriteLine();
    backend::RunResult ran;
    {
      const ScopedTimer timer(Phase::Run);
      ran = ctx_.native.Run(output);
    }
    if (ran.status != backend::RunResult::Status::Exited) {
      printer.ErrorWriteLine("Error: Execution resulted in exception: " + ran.detail);
      return CompileResult{CompileStatus::ExecutionFault, output};
    }
    if (ran.code != 0) {
      printer.WriteLine("Program exited with code " + std::to_string(ran.code));
    }
    return CompileResult{CompileStatus::Succeeded, output};
  }

  printer.WriteLine("Compiled assembly into " + shown);
  if (config.optimize && !CopyImmutableDependency(program_name)) {
    return CompileResult{CompileStatus::OutputError, output};
  }
  return CompileResult{CompileStatus::Succeeded, output};
}

}  // namespace proofc::codegen
