#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace symptomops::core::process {

// Runs `command` through the platform shell, capturing stdout+stderr.
//
// Contract:
// - true: the command was spawned; `exit_code` carries its exit status
//   (127 usually means "command not found").
// - false: the shell itself could not be started; `error` explains why.
bool RunShellCommand(const std::string& command, std::string& output, int& exit_code,
                     std::string& error);

// Options for a long-running shell command whose output is streamed to disk.
struct StreamedCommandOptions {
  std::filesystem::path output_path;
  // Granularity at which `should_stop` is re-checked.
  std::chrono::milliseconds poll_interval{100};
  // Grace period between SIGTERM and SIGKILL once a stop is requested.
  std::chrono::milliseconds kill_grace{2000};
  std::function<bool()> should_stop;
};

struct StreamedCommandResult {
  int exit_code = -1;
  bool stopped = false;
  std::uint64_t bytes_written = 0;
};

// Runs `command` in its own process group and appends everything it prints to
// `options.output_path` until it exits or `options.should_stop()` returns
// true. On stop the whole process group is terminated, so commands that fork
// helpers (tcpdump wrappers, `kubectl exec` sessions) do not outlive the
// caller.
//
// Contract:
// - true: the command ran and has been reaped; `result` is populated.
// - false: spawn or output-file failure; `error` explains why.
bool RunShellCommandUntilStopped(const std::string& command,
                                 const StreamedCommandOptions& options,
                                 StreamedCommandResult& result,
                                 std::string& error);

} // namespace symptomops::core::process
