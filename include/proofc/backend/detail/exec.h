/***
 * Name: proofc::backend::detail (exec helpers)
 * Purpose: Internal helpers to build argv and exec/wait for child processes.
 * Inputs: Vector<string> for argv construction; argv for exec
 * Outputs: Mutable argv pointer array; child termination status
 * Theory of Operation: Keep the toolchain driver small; POSIX fork/execvp/waitpid.
 */
#pragma once

#include <string>
#include <vector>

namespace proofc {
namespace backend {
namespace detail {

/*** BuildArgvMutable: Build null-terminated argv pointers referencing args storage. */
std::vector<char*> BuildArgvMutable(std::vector<std::string>& args);

/*** ExecStatus: How a child ended. */
struct ExecStatus {
  bool launched{false};
  bool exited{false};
  int code{0};  // exit code when exited, signal number otherwise
};

/***
 * Name: proofc::backend::detail::ExecAndWait
 * Purpose: fork/execvp and wait; err is filled when the child could not be started.
 * Inputs: argv, err, captured_stderr (optional)
 * Outputs: ExecStatus; the child's stderr text in *captured_stderr when given,
 *   otherwise the child inherits stderr
 */
ExecStatus ExecAndWait(std::vector<char*>& argv, std::string& err, std::string* captured_stderr = nullptr);

/*** SplitLines: Non-empty lines of text, without line terminators. */
std::vector<std::string> SplitLines(const std::string& text);

/*** JoinArgv: Space-joined display form of argv (for messages). */
std::string JoinArgv(const std::vector<char*>& argv);

}  // namespace detail
}  // namespace backend
}  // namespace proofc
