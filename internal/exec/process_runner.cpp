#include "process_runner.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <limits>
#include <string>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "internal/util/errors.hpp"

namespace edgerun::exec {

namespace {

constexpr int kExecFailedStatus = 127;

std::string ErrnoMessage(const std::string& action) {
  return action + " failed: " + std::strerror(errno);
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void ExecChild(char* const* args, int out_fd) {
  ::setpgid(0, 0);
  ::dup2(out_fd, STDOUT_FILENO);
  ::dup2(out_fd, STDERR_FILENO);
  ::close(out_fd);

  int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::close(devnull);
  }

  ::execvp(args[0], args);

  static constexpr char kPrefix[] = "exec failed: ";
  ssize_t               ignored   = ::write(STDERR_FILENO, kPrefix, sizeof(kPrefix) - 1);
  ignored                         = ::write(STDERR_FILENO, args[0], std::strlen(args[0]));
  ignored                         = ::write(STDERR_FILENO, "\n", 1);
  (void)ignored;
  ::_exit(kExecFailedStatus);
}

void KillGroup(pid_t pid) {
  if (::kill(-pid, SIGKILL) != 0) {
    ::kill(pid, SIGKILL);
  }
}

std::string DescribeStatus(int status) {
  if (WIFEXITED(status)) {
    return "exit status " + std::to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return "signal: " + std::string(::strsignal(WTERMSIG(status)));
  }
  return "unknown wait status " + std::to_string(status);
}

} // namespace

CommandResult ProcessRunner::Run(const std::vector<std::string>& argv, util::Deadline deadline) {
  if (argv.empty() || argv.front().empty()) {
    throw util::ExecutionFailure("no command provided");
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw util::ExecutionFailure(ErrnoMessage("pipe"));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const auto msg = ErrnoMessage("fork");
    ::close(fds[0]);
    ::close(fds[1]);
    throw util::ExecutionFailure(msg);
  }

  if (pid == 0) {
    ::close(fds[0]);
    ExecChild(args.data(), fds[1]);
  }

  // Parent. Setting the group here as well closes the race with an early kill.
  ::setpgid(pid, pid);
  ::close(fds[1]);

  CommandResult         result;
  std::array<char, 4096> buffer;
  bool                  eof = false;

  while (!eof) {
    const auto remaining = deadline.Remaining();
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    pollfd pfd{fds[0], POLLIN, 0};
    const auto wait_ms = std::min<std::chrono::milliseconds::rep>(remaining.count(), std::numeric_limits<int>::max());
    const int  ready   = ::poll(&pfd, 1, static_cast<int>(wait_ms));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      result.error = ErrnoMessage("poll");
      break;
    }
    if (ready == 0) {
      // Wait slice over; the deadline check above decides.
      continue;
    }

    const ssize_t count = ::read(fds[0], buffer.data(), buffer.size());
    if (count > 0) {
      result.output.append(buffer.data(), static_cast<size_t>(count));
    } else if (count == 0) {
      eof = true;
    } else if (errno != EINTR && errno != EAGAIN) {
      result.error = ErrnoMessage("read");
      break;
    }
  }

  if (!eof) {
    KillGroup(pid);
  }
  ::close(fds[0]);

  // The pipe can close before the child exits; keep honouring the deadline.
  int status = 0;
  for (;;) {
    const pid_t waited = ::waitpid(pid, &status, eof && !result.timed_out ? WNOHANG : 0);
    if (waited == pid) {
      break;
    }
    if (waited < 0) {
      if (errno == EINTR) {
        continue;
      }
      result.error = ErrnoMessage("waitpid");
      return result;
    }
    if (deadline.Expired()) {
      result.timed_out = true;
      KillGroup(pid);
      continue;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  if (result.timed_out) {
    result.error = "deadline exceeded";
    return result;
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  if (result.error.empty() && !(WIFEXITED(status) && WEXITSTATUS(status) == 0)) {
    result.error = DescribeStatus(status);
  }
  return result;
}

} // namespace edgerun::exec
