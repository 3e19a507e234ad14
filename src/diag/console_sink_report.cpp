/***
 * Name: proofc::diag::ConsoleSink::Report / Count
 * Purpose: Print a diagnostic through the Printer and count it by severity.
 */
#include "proofc/diag/console_sink.h"

#include <cstddef>

namespace proofc::diag {

auto ConsoleSink::Report(const Diagnostic& diag) -> void {
  ++counts_[static_cast<std::size_t>(diag.severity)];
  if (diag.severity == Severity::Error) {
    printer_.ErrorWriteLine(Format(diag));
  } else {
    printer_.WriteLine(Format(diag));
  }
}

auto ConsoleSink::Count(Severity severity) const -> std::size_t {
  return counts_[static_cast<std::size_t>(severity)];
}

}  // namespace proofc::diag
