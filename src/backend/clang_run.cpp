/***
 * Name: proofc::backend::ClangToolchain::Run
 * Purpose: Execute a built artifact and classify how it ended.
 * Inputs: artifact path (run without arguments, inheriting stdio)
 * Outputs: RunResult: Exited with its code, Signaled with the signal, or LaunchFailed
 */
#include "proofc/backend/native_toolchain.h"

#include <cstring>
#include <string>
#include <vector>

#include "proofc/backend/detail/exec.h"

namespace proofc::backend {

auto ClangToolchain::Run(const std::string& artifact) -> RunResult {
  // execvp searches PATH for names without a slash.
  std::vector<std::string> args{artifact.find('/') == std::string::npos ? "./" + artifact : artifact};
  std::vector<char*> argv = detail::BuildArgvMutable(args);
  RunResult result;
  std::string err;
  const detail::ExecStatus status = detail::ExecAndWait(argv, err);
  if (!status.launched) {
    result.status = RunResult::Status::LaunchFailed;
    result.detail = err;
    return result;
  }
  result.code = status.code;
  if (status.exited) {
    result.status = RunResult::Status::Exited;
    return result;
  }
  result.status = RunResult::Status::Signaled;
  result.detail = "terminated by signal " + std::to_string(status.code) + " (" + strsignal(status.code) + ")";
  return result;
}

}  // namespace proofc::backend
