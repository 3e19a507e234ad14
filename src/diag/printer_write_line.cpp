/***
 * Name: proofc::diag::Printer::WriteLine / AdvisoryWriteLine / ErrorWriteLine
 * Purpose: Line-oriented output primitives of the Printer.
 * Inputs: line text
 * Outputs: Regular and advisory lines on the output stream; error lines on the
 *   error stream (and the mirror, when set)
 * Theory of Operation: Each call writes exactly one newline-terminated line.
 */
#include "proofc/diag/printer.h"

#include <ostream>
#include <string>

namespace proofc::diag {

auto Printer::WriteLine(const std::string& line) -> void { out_ << line << '\n'; }

auto Printer::AdvisoryWriteLine(const std::string& line) -> void { out_ << line << '\n'; }

auto Printer::ErrorWriteLine(const std::string& line) -> void {
  err_ << line << '\n';
  if (mirror_ != nullptr) {
    *mirror_ << line << '\n';
  }
}

}  // namespace proofc::diag
