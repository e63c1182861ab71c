#include "core/process/command_runner.hpp"

#include "core/fs_utils.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace symptomops::core::process {

namespace {

int DecodeWaitStatus(int raw_status) {
  if (WIFEXITED(raw_status)) {
    return WEXITSTATUS(raw_status);
  }
  if (WIFSIGNALED(raw_status)) {
    return 128 + WTERMSIG(raw_status);
  }
  return raw_status;
}

// Owns one end of a pipe and closes it on scope exit.
class ScopedFd {
public:
  explicit ScopedFd(int fd = -1) : fd_(fd) {}
  ~ScopedFd() {
    Reset();
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const {
    return fd_;
  }

  void Reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_;
};

// Reads whatever is currently available on `fd` into `out`.
// Returns false once the write end has been closed (EOF) or on a hard error.
bool DrainAvailable(int fd, std::ofstream& out, std::uint64_t& bytes_written) {
  char buffer[4096];
  const ssize_t count = ::read(fd, buffer, sizeof(buffer));
  if (count > 0) {
    out.write(buffer, count);
    out.flush();
    bytes_written += static_cast<std::uint64_t>(count);
    return true;
  }
  if (count < 0 && (errno == EINTR || errno == EAGAIN)) {
    return true;
  }
  return false;
}

} // namespace

bool RunShellCommand(const std::string& command, std::string& output, int& exit_code,
                     std::string& error) {
  output.clear();
  exit_code = -1;
  error.clear();

  const std::string wrapped = command + " 2>&1";
  FILE* pipe = popen(wrapped.c_str(), "r");
  if (pipe == nullptr) {
    error = "failed to execute command: " + command;
    return false;
  }

  char buffer[4096];
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
    output.append(buffer);
  }

  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    exit_code = -1;
  } else {
    exit_code = DecodeWaitStatus(raw_status);
  }

  return true;
}

bool RunShellCommandUntilStopped(const std::string& command,
                                 const StreamedCommandOptions& options,
                                 StreamedCommandResult& result,
                                 std::string& error) {
  result = StreamedCommandResult{};
  error.clear();

  if (!EnsureParentDirectory(options.output_path, error)) {
    return false;
  }
  std::ofstream out(options.output_path, std::ios::binary | std::ios::app);
  if (!out) {
    error = "failed to open command output file '" + options.output_path.string() + "'";
    return false;
  }

  // Close-on-exec keeps commands spawned concurrently by other tasks from
  // inheriting this pipe; dup2 below clears the flag on the child's stdio.
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    error = std::string("failed to create pipe: ") + std::strerror(errno);
    return false;
  }
  ScopedFd read_end(fds[0]);
  ScopedFd write_end(fds[1]);

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = std::string("failed to fork: ") + std::strerror(errno);
    return false;
  }
  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    ::setpgid(0, 0);
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);
    ::close(fds[0]);
    ::close(fds[1]);
    ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    ::_exit(127);
  }

  // Both sides call setpgid so the group exists before any kill below.
  ::setpgid(pid, pid);
  write_end.Reset();

  const int poll_ms = static_cast<int>(options.poll_interval.count() > 0
                                           ? options.poll_interval.count()
                                           : 100);
  bool reaped = false;
  bool pipe_open = true;
  int raw_status = 0;
  std::chrono::steady_clock::time_point term_sent_at{};
  bool kill_sent = false;

  while (!reaped) {
    if (pipe_open) {
      pollfd pfd{};
      pfd.fd = read_end.get();
      pfd.events = POLLIN;
      const int ready = ::poll(&pfd, 1, poll_ms);
      if (ready > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
        pipe_open = DrainAvailable(read_end.get(), out, result.bytes_written);
      }
    } else {
      std::this_thread::sleep_for(options.poll_interval);
    }

    const pid_t waited = ::waitpid(pid, &raw_status, WNOHANG);
    if (waited == pid) {
      reaped = true;
      break;
    }
    if (waited < 0 && errno != EINTR) {
      error = std::string("failed to wait for command: ") + std::strerror(errno);
      ::kill(-pid, SIGKILL);
      return false;
    }

    if (!result.stopped && options.should_stop && options.should_stop()) {
      result.stopped = true;
      term_sent_at = std::chrono::steady_clock::now();
      ::kill(-pid, SIGTERM);
    }
    if (result.stopped && !kill_sent &&
        std::chrono::steady_clock::now() - term_sent_at >= options.kill_grace) {
      kill_sent = true;
      ::kill(-pid, SIGKILL);
    }
  }

  // Pick up whatever the process printed right before exiting.
  while (pipe_open) {
    pollfd pfd{};
    pfd.fd = read_end.get();
    pfd.events = POLLIN;
    if (::poll(&pfd, 1, 0) <= 0) {
      break;
    }
    pipe_open = DrainAvailable(read_end.get(), out, result.bytes_written);
  }
  if (result.stopped) {
    // Leftover helpers in the group must not keep writing after we return.
    ::kill(-pid, SIGKILL);
  }

  result.exit_code = DecodeWaitStatus(raw_status);
  if (!out) {
    error = "failed while writing command output file '" + options.output_path.string() + "'";
    return false;
  }
  return true;
}

} // namespace symptomops::core::process
