/***
 * Name: proofc::diag::RealigningSink
 * Purpose: Adapter between the proof engine and the source-level sink.
 * Inputs: Diagnostics in proof-engine coordinates (1-based columns)
 * Outputs: Diagnostics in source coordinates (0-based columns), followed by one
 *   "Related location" info diagnostic per nested origin
 * Theory of Operation: Wraps another DiagnosticSink; walks the Location::inner
 *   chain iteratively, shifting each column by one.
 */
#pragma once

#include <cstddef>

#include "proofc/diag/diagnostic.h"

namespace proofc {
namespace diag {

class RealigningSink : public DiagnosticSink {
 public:
  explicit RealigningSink(DiagnosticSink& target) : target_(target) {}

  void Report(const Diagnostic& diag) override;
  std::size_t Count(Severity severity) const override;

  /*** Realign: Copy of loc with its column moved to the source convention (no chain). */
  static Location Realign(const Location& loc);

 private:
  DiagnosticSink& target_;
};

}  // namespace diag
}  // namespace proofc
