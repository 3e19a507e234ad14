/***
 * Name: proofc::backend (native toolchain)
 * Purpose: Build and run generated native sources.
 * Inputs: BuildRequest (sources, libraries, flags, output, kind); artifact paths
 * Outputs: BuildResult / RunResult values
 * Theory of Operation: NativeToolchain is the seam the code-gen dispatcher talks to;
 *   ClangToolchain shells out to a clang-compatible C++ driver via fork/execvp.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace proofc {
namespace backend {

enum class OutputKind { Executable, Library };

struct BuildRequest {
  std::vector<std::string> sources;    // generated source first, then native sources
  std::vector<std::string> libraries;  // link inputs (paths)
  std::vector<std::string> options;    // compiler flags
  std::vector<std::string> link_refs;  // -l references, without the prefix
  std::string output;
  OutputKind kind{OutputKind::Executable};
};

struct BuildResult {
  bool ok{false};
  std::vector<std::string> errors;    // compiler diagnostics then a summary line, on failure
  std::vector<std::string> warnings;  // compiler diagnostics of a successful build
};

struct RunResult {
  enum class Status { Exited, Signaled, LaunchFailed };
  Status status{Status::Exited};
  int code{0};         // exit code or signal number
  std::string detail;  // message for Signaled/LaunchFailed
};

class NativeToolchain {
 public:
  virtual ~NativeToolchain() = default;
  virtual BuildResult Build(const BuildRequest& request) = 0;
  virtual RunResult Run(const std::string& artifact) = 0;
};

class ClangToolchain : public NativeToolchain {
 public:
  explicit ClangToolchain(std::string cxx = "clang++") : cxx_(std::move(cxx)) {}

  BuildResult Build(const BuildRequest& request) override;
  RunResult Run(const std::string& artifact) override;

  /*** CommandLine: Full argv (compiler first) for request. */
  std::vector<std::string> CommandLine(const BuildRequest& request) const;

 private:
  std::string cxx_;
};

}  // namespace backend
}  // namespace proofc
