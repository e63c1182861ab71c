#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/cli_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;

// With no exerciser configured, collect keeps watching until --timeout and
// reports lines appended while it runs.
int main() {
  using symptomops::tests::common::AssertContains;
  using symptomops::tests::common::CapturedDispatch;
  using symptomops::tests::common::CreateUniqueTempDir;
  using symptomops::tests::common::DispatchCaptured;
  using symptomops::tests::common::Fail;
  using symptomops::tests::common::FindOnlyBundle;
  using symptomops::tests::common::ReadFileToString;
  using symptomops::tests::common::RemovePathBestEffort;
  using symptomops::tests::common::WriteTextFile;

  const fs::path temp_root = CreateUniqueTempDir("symptomops-collect-no-exerciser");
  const fs::path out_root = temp_root / "out";
  const fs::path app_log = temp_root / "w.log";
  WriteTextFile(app_log, "ERROR before the session\n");
  const std::string snapshot = symptomops::tests::common::WriteClusterSnapshot(temp_root).string();
  const std::string config = symptomops::tests::common::WriteCliConfig(
                                 temp_root, {.log_paths = {app_log.string()},
                                             .collection_timeout = "10m",
                                             .check_interval = "20ms",
                                             .output_dir = out_root.string()})
                                 .string();

  std::thread appender([&]() {
    // The bundle appears once validation passed and tasks are starting.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
      std::error_code ec;
      if (fs::exists(out_root, ec) && !FindOnlyBundle(out_root).empty()) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    std::ofstream out(app_log, std::ios::binary | std::ios::app);
    out << "ERROR late\n";
  });

  const auto started = std::chrono::steady_clock::now();
  const CapturedDispatch result =
      DispatchCaptured({"symptomops", "collect", "-p", "uecm", "-c", config, "--cluster-snapshot",
                        snapshot, "--timeout", "1500ms"});
  const auto elapsed = std::chrono::steady_clock::now() - started;
  appender.join();

  if (result.exit_code != 0) {
    Fail("collect without exerciser failed with exit " + std::to_string(result.exit_code) + ": " +
         result.err);
  }
  if (elapsed < std::chrono::milliseconds(1400)) {
    Fail("collect returned before the timeout although no exerciser was configured");
  }
  AssertContains(result.out, "end_reason: timeout");
  AssertContains(result.out, "error_events: 1");
  AssertContains(result.out, "tasks: 1");

  const fs::path bundle = FindOnlyBundle(out_root);
  if (fs::exists(bundle / "exerciser")) {
    Fail("no exerciser output expected without an exerciser command");
  }
  AssertContains(ReadFileToString(bundle / "error_report.json"), "ERROR late");
  AssertContains(ReadFileToString(bundle / "session.json"), "\"end_reason\":\"timeout\"");

  RemovePathBestEffort(temp_root);
  return 0;
}
