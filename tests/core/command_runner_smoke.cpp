#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "core/process/command_runner.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace {

// Pipe descriptors above stdio listed in `listing`.
std::string InheritedPipes(const std::string& listing) {
  std::istringstream lines(listing);
  std::string line;
  std::string inherited;
  while (std::getline(lines, line)) {
    const std::size_t slash = line.rfind('/');
    const std::string fd = slash == std::string::npos ? line : line.substr(slash + 1);
    if (fd == "0" || fd == "1" || fd == "2") {
      continue;
    }
    inherited += line + "\n";
  }
  return inherited;
}

} // namespace

int main() {
  using symptomops::tests::common::AssertContains;
  using symptomops::tests::common::CreateUniqueTempDir;
  using symptomops::tests::common::Fail;
  using symptomops::tests::common::ReadFileToString;
  using symptomops::tests::common::RemovePathBestEffort;
  namespace process = symptomops::core::process;

  const fs::path temp_root = CreateUniqueTempDir("symptomops-command-runner");

  // Captured output and exit code.
  {
    std::string output;
    int exit_code = -1;
    std::string error;
    if (!process::RunShellCommand("echo hello; exit 3", output, exit_code, error)) {
      Fail("RunShellCommand failed: " + error);
    }
    AssertContains(output, "hello");
    if (exit_code != 3) {
      Fail("expected exit code 3, got " + std::to_string(exit_code));
    }
  }

  // A streamed command's pipe is not inherited by commands other threads
  // start while it runs.
  {
    std::atomic<bool> stop{false};
    const fs::path output_path = temp_root / "streamed" / "output.log";
    process::StreamedCommandResult result;
    std::string streamed_error;
    bool streamed_ok = false;
    std::thread streamed([&]() {
      streamed_ok = process::RunShellCommandUntilStopped(
          "echo started; sleep 30",
          {.output_path = output_path,
           .poll_interval = std::chrono::milliseconds(10),
           .kill_grace = std::chrono::milliseconds(200),
           .should_stop = [&stop]() { return stop.load(); }},
          result, streamed_error);
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
      std::error_code ec;
      if (fs::exists(output_path, ec) &&
          ReadFileToString(output_path).find("started") != std::string::npos) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::string listing;
    int exit_code = -1;
    std::string error;
    const bool listed = process::RunShellCommand("find /proc/$$/fd -mindepth 1 -lname 'pipe:*'",
                                                 listing, exit_code, error);
    stop.store(true);
    streamed.join();

    if (!listed) {
      Fail("RunShellCommand failed: " + error);
    }
    const std::string inherited = InheritedPipes(listing);
    if (!inherited.empty()) {
      Fail("concurrent command inherited pipe descriptors:\n" + inherited);
    }
    if (!streamed_ok) {
      Fail("RunShellCommandUntilStopped failed: " + streamed_error);
    }
    if (!result.stopped) {
      Fail("streamed command should report it was stopped");
    }
  }

  RemovePathBestEffort(temp_root);
  return 0;
}
