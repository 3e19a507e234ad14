/***
 * Name: proofc::diag::RealigningSink::Report / Count
 * Purpose: Forward a proof-engine diagnostic in source coordinates, then one
 *   "Related location" info diagnostic for each nested origin.
 * Inputs: diag (location may carry an inner chain)
 * Outputs: 1 + chain length diagnostics on the target sink
 * Theory of Operation: Iterative walk over Location::inner; related entries are
 *   never errors so they do not change error counts.
 */
#include "proofc/diag/realigning_sink.h"

#include <cstddef>

namespace proofc::diag {

auto RealigningSink::Report(const Diagnostic& diag) -> void {
  Diagnostic primary = diag;
  primary.loc = Realign(diag.loc);
  target_.Report(primary);

  for (const Location* origin = diag.loc.inner.get(); origin != nullptr; origin = origin->inner.get()) {
    Diagnostic related;
    related.severity = Severity::Info;
    related.loc = Realign(*origin);
    related.message = "Related location";
    related.category = diag.category;
    target_.Report(related);
  }
}

auto RealigningSink::Count(Severity severity) const -> std::size_t { return target_.Count(severity); }

}  // namespace proofc::diag
