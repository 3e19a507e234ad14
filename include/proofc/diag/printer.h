/***
 * Name: proofc::diag::Printer
 * Purpose: Single textual output channel for the pipeline (plain, advisory, error
 *   lines and verification trailers).
 * Inputs: Output and error streams; optional mirror stream for error lines
 * Outputs: Formatted text
 * Theory of Operation: The driver creates one Printer per run and passes it by
 *   reference; nothing is written to std::cout/std::cerr directly by pipeline code.
 */
#pragma once

#include <ostream>
#include <string>

namespace proofc {
namespace pipeline { struct PipelineStatistics; }

namespace diag {

class Printer {
 public:
  Printer(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

  /*** SetMirror: Copy every error line to mirror as well (nullptr disables). */
  void SetMirror(std::ostream* mirror) { mirror_ = mirror; }

  void WriteLine(const std::string& line = "");
  void AdvisoryWriteLine(const std::string& line);
  void ErrorWriteLine(const std::string& line);
  /*** WriteTrailer: "proofc finished with N verified, M errors[, ...]". */
  void WriteTrailer(const pipeline::PipelineStatistics& stats);

  std::ostream& Out() { return out_; }

 private:
  std::ostream& out_;
  std::ostream& err_;
  std::ostream* mirror_{nullptr};
};

}  // namespace diag
}  // namespace proofc
