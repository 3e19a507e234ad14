/***
 * Name: proofc::backend::detail::ExecAndWait
 * Purpose: Exec a command via execvp and wait for it; report how it ended.
 * Inputs: argv (mutable, null-terminated), err (out), captured_stderr (optional out)
 * Outputs: ExecStatus; err is set when the child could not be started or waited for
 * Theory of Operation: POSIX fork/exec/wait. A close-on-exec pipe carries the errno
 *   of a failed execvp back to the parent, so "could not start" is distinguishable
 *   from a program that exits with 127. When capturing, the child's stderr is a
 *   second pipe drained to EOF before the errno pipe is read.
 */
#include "proofc/backend/detail/exec.h"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace proofc {
namespace backend {
namespace detail {

static void ClosePipe(int (&fds)[2]) {  // NOLINT(cppcoreguidelines-avoid-c-arrays)
  for (int& fd : fds) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

static void DrainInto(int fd, std::string& out) {
  char buffer[4096];  // NOLINT(cppcoreguidelines-avoid-c-arrays)
  for (;;) {
    const ssize_t got = read(fd, buffer, sizeof(buffer));
    if (got > 0) {
      out.append(buffer, static_cast<std::size_t>(got));
    } else if (got == 0 || errno != EINTR) {
      return;
    }
  }
}

auto ExecAndWait(std::vector<char*>& argv, std::string& err, std::string* captured_stderr)
    -> ExecStatus {  // NOLINT(readability-function-size)
  ExecStatus result;
  const std::string program = argv.empty() || argv[0] == nullptr ? std::string() : std::string(argv[0]);
  if (program.empty()) {
    err = "empty command line";
    return result;
  }

  int fds[2] = {-1, -1};
  if (pipe2(fds, O_CLOEXEC) != 0) {
    err = "failed to create pipe for " + program + ": " + std::strerror(errno);
    return result;
  }

  int capture[2] = {-1, -1};
  if (captured_stderr != nullptr && pipe2(capture, O_CLOEXEC) != 0) {
    err = "failed to create pipe for " + program + ": " + std::strerror(errno);
    ClosePipe(fds);
    return result;
  }

  const auto pid = fork();
  if (pid < 0) {
    err = "failed to fork() for " + program + ": " + std::strerror(errno);
    ClosePipe(fds);
    ClosePipe(capture);
    return result;
  }
  if (pid == 0) {
    close(fds[0]);
    if (capture[1] >= 0) {
      dup2(capture[1], STDERR_FILENO);
    }
    execvp(argv[0], argv.data());
    const int exec_errno = errno;
    [[maybe_unused]] const auto written = write(fds[1], &exec_errno, sizeof(exec_errno));
    constexpr int kExecFailure = 127;
    _exit(kExecFailure);
  }

  close(fds[1]);
  if (captured_stderr != nullptr) {
    close(capture[1]);
    DrainInto(capture[0], *captured_stderr);
    close(capture[0]);
  }
  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = read(fds[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  close(fds[0]);

  int status = 0;
  pid_t waited = 0;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  if (waited < 0) {
    err = "failed to waitpid() for " + program + ": " + std::strerror(errno);
    return result;
  }
  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    err = "failed to execute " + program + ": " + std::strerror(child_errno);
    return result;
  }

  result.launched = true;
  if (WIFEXITED(status)) {
    result.exited = true;
    result.code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.code = WTERMSIG(status);
  }
  return result;
}

}  // namespace detail
}  // namespace backend
}  // namespace proofc
