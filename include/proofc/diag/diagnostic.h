/***
 * Name: proofc::diag (diagnostic)
 * Purpose: Diagnostic value types and the sink capability every reporter implements.
 * Inputs: Messages with a location, severity and optional nested origin chain
 * Outputs: DiagnosticSink interface consumed by the pipeline and by toolchains
 * Theory of Operation: A Location may point at the location it was derived from
 *   (e.g. a call site inlined into a callee); sinks decide how to render that chain.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace proofc {
namespace diag {

enum class Severity { Error, Warning, Info };

struct Location {
  std::string file;
  int line{0};
  int col{0};
  // Origin this location was derived from; null for plain locations.
  std::shared_ptr<const Location> inner;
};

struct Diagnostic {
  Severity severity{Severity::Error};
  Location loc;
  std::string message;
  std::string category;
};

class DiagnosticSink {
 public:
  virtual ~DiagnosticSink() = default;
  /*** Report: Record one diagnostic. */
  virtual void Report(const Diagnostic& diag) = 0;
  /*** Count: Number of diagnostics of the given severity reported so far. */
  virtual std::size_t Count(Severity severity) const = 0;
};

}  // namespace diag
}  // namespace proofc
