/***
 * Name: proofc::diag::ConsoleSink::Format
 * Purpose: Render a diagnostic as "file(line,col): Error: message".
 * Inputs: diag
 * Outputs: One line without trailing newline
 * Theory of Operation: The location prefix is omitted when the file is unknown;
 *   a category is appended to the severity label as "Error (category)".
 */
#include "proofc/diag/console_sink.h"

#include <sstream>
#include <string>

namespace proofc::diag {

static const char* SeverityLabel(Severity severity) {
  switch (severity) {
    case Severity::Error: return "Error";
    case Severity::Warning: return "Warning";
    case Severity::Info: return "Info";
  }
  return "Error";
}

auto ConsoleSink::Format(const Diagnostic& diag) -> std::string {
  std::ostringstream line;
  if (!diag.loc.file.empty()) {
    line << diag.loc.file << "(" << diag.loc.line << "," << diag.loc.col << "): ";
  }
  line << SeverityLabel(diag.severity);
  if (!diag.category.empty()) {
    line << " (" << diag.category << ")";
  }
  line << ": " << diag.message;
  return line.str();
}

}  // namespace proofc::diag
