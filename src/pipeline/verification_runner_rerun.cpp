/***
 * Name: proofc::pipeline::VerificationRunner::RerunForDiagnostics
 * Purpose: Dump a malformed VC program, re-parse it and re-check it so the engine's
 *   diagnostics refer to positions in the dump file.
 * Inputs: program, dump path
 * Outputs: Diagnostics only; the re-check result is not used.
 */
#include <memory>
#include <string>

#include "proofc/pipeline/verification_runner.h"

namespace proofc::pipeline {

void VerificationRunner::RerunForDiagnostics(toolchain::VcProgram& program, const std::string& artifact_path) {
  auto& engine = ctx_.toolchain.GetProofEngine();
  std::string err;
  if (!engine.Print(program, artifact_path, err)) {
    ctx_.printer.ErrorWriteLine("proofc: " + err);
    return;
  }
  ctx_.printer.WriteLine();
  ctx_.printer.WriteLine(
      "*** Encountered internal translation error - re-running the proof engine to get better debug information");
  ctx_.printer.WriteLine();

  std::unique_ptr<toolchain::VcProgram> reparsed = engine.Parse(artifact_path, ctx_.engine_sink);
  if (!reparsed) {
    return;
  }
  // Outcome of the first check stands.
  static_cast<void>(engine.ResolveAndTypecheck(*reparsed, artifact_path, ctx_.engine_sink));
}

}  // namespace proofc::pipeline
