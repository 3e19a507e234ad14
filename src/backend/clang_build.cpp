/***
 * Name: proofc::backend::ClangToolchain::Build
 * Purpose: Run the C++ driver for a build request.
 * Inputs: request
 * Outputs: BuildResult; errors holds one message per line of compiler stderr followed
 *   by a summary of the failed invocation, warnings holds the stderr of a successful build
 */
#include "proofc/backend/native_toolchain.h"

#include <string>
#include <vector>

#include "proofc/backend/detail/exec.h"

namespace proofc::backend {

auto ClangToolchain::Build(const BuildRequest& request) -> BuildResult {
  std::vector<std::string> args = CommandLine(request);
  std::vector<char*> argv = detail::BuildArgvMutable(args);
  BuildResult result;
  std::string err;
  std::string diagnostics;
  const detail::ExecStatus status = detail::ExecAndWait(argv, err, &diagnostics);
  if (!status.launched) {
    result.errors.push_back(err);
    return result;
  }
  if (!status.exited || status.code != 0) {
    constexpr int kUnknownExitCode = -1;
    const int code = status.exited ? status.code : kUnknownExitCode;
    result.errors = detail::SplitLines(diagnostics);
    result.errors.push_back(cxx_ + " invocation failed (rc=" + std::to_string(code) + "): " +
                            detail::JoinArgv(argv));
    return result;
  }
  result.ok = true;
  result.warnings = detail::SplitLines(diagnostics);
  return result;
}

}  // namespace proofc::backend
