/***
 * Name: proofc::metrics::Metrics::PhaseName
 * Purpose: Stable display name of a pipeline phase (used by text and JSON output).
 */
#include "proofc/metrics/metrics.h"

namespace proofc::metrics {

auto Metrics::PhaseName(Phase phase) -> const char* {
  switch (phase) {
    case Phase::Translate: return "Translate";
    case Phase::Resolve: return "Resolve";
    case Phase::Optimize: return "Optimize";
    case Phase::Solve: return "Solve";
    case Phase::CodeGen: return "CodeGen";
    case Phase::NativeBuild: return "NativeBuild";
    case Phase::Run: return "Run";
  }
  return "Unknown";
}

}  // namespace proofc::metrics
