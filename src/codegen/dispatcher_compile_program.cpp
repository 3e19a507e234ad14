/***
 * Name: proofc::codegen::Dispatcher::CompileProgram
 * Purpose: Generate target code, persist it when requested and hand it to the build.
 * Inputs:
 *   - program: checked program (its reporter counts generation errors)
 *   - program_name: input path the target and artifact names derive from
 *   - other_files: native sources/libraries
 *   - invoke_native: build (and maybe run) after generation
 * Outputs: CompileResult
 * Theory of Operation:
 *   1) Snapshot the error count, generate into memory; complete iff unchanged.
 *   2) Persist as <program>.<ext> when spilling, when native files were given, or
 *      when a script target is "built".
 *   3) Partial programs are never built. Script targets stop after (2).
 *   4) C++ targets are written to the temp dir if not persisted, then built.
 */
#include "proofc/codegen/dispatcher.h"

#include <cstddef>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "proofc/support/fs.h"

namespace proofc::codegen {

namespace {

auto WriteTarget(diag::Printer& printer, const std::string& path, const std::string& text) -> bool {
  std::string err;
  if (!support::WriteFile(path, text, err)) {
    printer.ErrorWriteLine("proofc: " + err);
    return false;
  }
  return true;
}

}  // namespace

auto Dispatcher::CompileProgram(toolchain::Program& program, const std::string& program_name,
                                const std::vector<pipeline::SourceDescriptor>& other_files, bool invoke_native)
    -> CompileResult {
  const auto& config = ctx_.config;
  const char* extension = CanonicalExtension(config.target);
  toolchain::CodeGenerator* generator = ctx_.toolchain.Generator(config.target);
  if (generator == nullptr) {
    ctx_.printer.ErrorWriteLine(std::string("Error: the toolchain provides no ") + extension + " code generator");
    return CompileResult{CompileStatus::BuildFailed, ""};
  }

  const std::size_t errors_before = program.Reporter().Count(diag::Severity::Error);
  bool has_main = false;
  std::string target_text;
  {
    const ScopedTimer timer(Phase::CodeGen);
    has_main = generator->HasMain(program);
    std::ostringstream out;
    generator->Compile(program, out);
    target_text = out.str();
  }
  const bool complete = program.Reporter().Count(diag::Severity::Error) == errors_before;
  const bool script = !NeedsNativeBuild(config.target);

  std::string target_file;
  if (config.spill_target_code > 0 || !other_files.empty() || (script && invoke_native)) {
    target_file = support::ChangeExtension(program_name, extension);
    if (!WriteTarget(ctx_.printer, target_file, target_text)) {
      return CompileResult{CompileStatus::OutputError, ""};
    }
    const std::string shown = support::FileName(target_file);
    ctx_.printer.WriteLine(complete ? "Compiled program written to " + shown
                                    : "File " + shown + " contains the partially compiled program");
  }

  if (!complete) {
    return CompileResult{invoke_native ? CompileStatus::PartialProgram : CompileStatus::Spilled, target_file};
  }
  if (!invoke_native) {
    return CompileResult{CompileStatus::Spilled, target_file};
  }
  if (script) {
    return CompileResult{CompileStatus::Succeeded, target_file};
  }

  if (target_file.empty()) {
    const std::string generated = support::FileName(support::ChangeExtension(program_name, extension));
    target_file = (std::filesystem::path(support::TempDir(config.dump_dir)) / generated).string();
    if (!WriteTarget(ctx_.printer, target_file, target_text)) {
      return CompileResult{CompileStatus::OutputError, ""};
    }
  }
  return BuildAndRun(target_file, has_main, program_name, other_files);
}

}  // namespace proofc::codegen
