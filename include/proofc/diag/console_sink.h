/***
 * Name: proofc::diag::ConsoleSink
 * Purpose: Default DiagnosticSink: renders diagnostics through the Printer and
 *   keeps per-severity counts.
 * Inputs: Diagnostics
 * Outputs: "file(line,col): Error: message" lines
 * Theory of Operation: Errors go to the Printer's error channel, everything else
 *   to the regular output; counts back DiagnosticSink::Count.
 */
#pragma once

#include <array>
#include <cstddef>
#include <string>

#include "proofc/diag/diagnostic.h"
#include "proofc/diag/printer.h"

namespace proofc {
namespace diag {

class ConsoleSink : public DiagnosticSink {
 public:
  explicit ConsoleSink(Printer& printer) : printer_(printer) {}

  void Report(const Diagnostic& diag) override;
  std::size_t Count(Severity severity) const override;

  /*** Format: Render one diagnostic as a single line. */
  static std::string Format(const Diagnostic& diag);

 private:
  Printer& printer_;
  std::array<std::size_t, 3> counts_{};
};

}  // namespace diag
}  // namespace proofc
