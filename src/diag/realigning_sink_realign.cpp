/***
 * Name: proofc::diag::RealigningSink::Realign
 * Purpose: Convert a proof-engine location (1-based column) to the source
 *   convention (0-based column).
 * Inputs: loc
 * Outputs: Copy of loc with col - 1 (0 stays 0, unknown) and no nested origin
 */
#include "proofc/diag/realigning_sink.h"

namespace proofc::diag {

auto RealigningSink::Realign(const Location& loc) -> Location {
  Location realigned;
  realigned.file = loc.file;
  realigned.line = loc.line;
  realigned.col = loc.col > 0 ? loc.col - 1 : 0;
  return realigned;
}

}  // namespace proofc::diag
