/***
 * Name: proofc::pipeline::TranslateProgram
 * Purpose: Lower a checked program into VC-units and optionally dump each one.
 * Inputs: program, context (print_file)
 * Outputs: VC-units in module order
 * Theory of Operation: With several verifiable modules every dump gets the unit
 *   name as suffix; with one module the print file is used as given.
 */
#include <cstddef>
#include <string>
#include <vector>

#include "proofc/metrics/metrics.h"
#include "proofc/pipeline/controller.h"
#include "proofc/pipeline/verification_runner.h"

namespace proofc::pipeline {

auto TranslateProgram(toolchain::Program& program, const PipelineContext& ctx) -> std::vector<toolchain::VcUnit> {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Translate);
  auto& translator = ctx.toolchain.GetTranslator();
  const std::size_t modules = translator.CountVerifiableModules(program);
  std::vector<toolchain::VcUnit> units = translator.Translate(program);

  if (ctx.config.print_file) {
    auto& engine = ctx.toolchain.GetProofEngine();
    for (const auto& unit : units) {
      if (!unit.program) {
        continue;
      }
      const std::string path = modules > 1 ? SuffixedPath(*ctx.config.print_file, unit.name)
                                           : *ctx.config.print_file;
      std::string err;
      if (!engine.Print(*unit.program, path, err)) {
        ctx.printer.ErrorWriteLine("proofc: " + err);
      }
    }
  }
  metrics::Metrics::IncCounter("translate.units", units.size());
  return units;
}

}  // namespace proofc::pipeline
