/***
 * Name: proofc::diag::Printer::WriteTrailer
 * Purpose: Print the verification summary for a set of statistics.
 * Inputs: stats
 * Outputs: Blank line, then "proofc finished with N verified, M errors" with the
 *   inconclusive/time-out/out-of-memory parts only when non-zero; a second line
 *   lists cached results when any exist.
 */
#include "proofc/diag/printer.h"

#include <cstdint>
#include <ostream>
#include <string>

#include "proofc/pipeline/outcome.h"

namespace proofc::diag {

static std::string Plural(std::uint64_t count, const char* noun) {
  return std::to_string(count) + " " + noun + (count == 1U ? "" : "s");
}

static void WriteFailureParts(std::ostream& out, std::uint64_t inconclusive, std::uint64_t timeouts,
                              std::uint64_t out_of_memory) {
  if (inconclusive != 0U) {
    out << ", " << Plural(inconclusive, "inconclusive");
  }
  if (timeouts != 0U) {
    out << ", " << Plural(timeouts, "time out");
  }
  if (out_of_memory != 0U) {
    out << ", " << out_of_memory << " out of memory";
  }
}

auto Printer::WriteTrailer(const pipeline::PipelineStatistics& stats) -> void {
  out_ << '\n';
  out_ << "proofc finished with " << stats.verified << " verified, " << Plural(stats.errors, "error");
  WriteFailureParts(out_, stats.inconclusive, stats.timeouts, stats.out_of_memory);
  out_ << '\n';
  if (stats.HasCached()) {
    out_ << "  cached: " << stats.cached_verified << " verified, " << Plural(stats.cached_errors, "error");
    WriteFailureParts(out_, stats.cached_inconclusive, stats.cached_timeouts, stats.cached_out_of_memory);
    out_ << '\n';
  }
}

}  // namespace proofc::diag
