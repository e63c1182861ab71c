#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "cluster/snapshot_client.hpp"
#include "core/logging/logger.hpp"
#include "session/session_orchestrator.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

using symptomops::session::EndReason;
using symptomops::session::IssueKind;
using symptomops::session::SessionState;
using symptomops::tests::common::AssertContains;
using symptomops::tests::common::Fail;
using symptomops::tests::common::ReadFileToString;

constexpr auto kTimeout = std::chrono::milliseconds(300);
constexpr auto kPollInterval = std::chrono::milliseconds(20);

void CheckTimedOut(const symptomops::session::SessionReport& report,
                   std::chrono::steady_clock::duration elapsed) {
  if (elapsed < kTimeout) {
    Fail("session drained before the timeout");
  }
  // Generous upper bound: one poll interval plus scheduling noise on CI.
  if (elapsed > kTimeout + kPollInterval + std::chrono::seconds(3)) {
    Fail("session overran the timeout");
  }
  if (report.final_state != SessionState::kClosed || report.end_reason != EndReason::kTimeout) {
    Fail("expected Closed with timeout end reason");
  }
  if (!report.HasIssue(IssueKind::kTimeoutExceeded)) {
    Fail("timeout should be reported as an issue");
  }
  if (report.channel.close_calls != 1U || !report.channel.closed_after_all_tasks_stopped) {
    Fail("channel must close once after all tasks stopped");
  }
  const std::string events_text = ReadFileToString(report.bundle_dir / "events.jsonl");
  AssertContains(events_text, "\"type\":\"timeout_exceeded\"");
  AssertContains(events_text, "\"end_reason\":\"timeout\"");
  AssertContains(ReadFileToString(report.bundle_dir / "summary.md"), "CLOSED WITH WARNINGS");
}

} // namespace

int main() {
  using symptomops::tests::common::CreateUniqueTempDir;
  using symptomops::tests::common::RemovePathBestEffort;

  const fs::path temp_root = CreateUniqueTempDir("symptomops-timeout");
  const fs::path watched = temp_root / "envoy.log";
  symptomops::tests::common::TouchFile(watched);

  symptomops::cluster::SnapshotClusterClient client;
  symptomops::tests::common::SeedReadyCluster(client, {"uecm-main"});
  std::ostringstream log_output;
  symptomops::core::logging::Logger logger(symptomops::core::logging::LogLevel::kInfo,
                                           log_output);

  // Exerciser outlives the timeout and must be stopped by the drain.
  {
    const auto session = symptomops::tests::common::MakeTestSession(
        temp_root / "out-slow", {"uecm"}, {watched.string()}, kTimeout, kPollInterval);
    symptomops::session::SessionOrchestrator orchestrator(session, client, logger);
    auto exerciser = std::make_unique<symptomops::tests::common::TimedExerciser>(
        std::chrono::seconds(30));
    auto* exerciser_view = exerciser.get();
    orchestrator.SetExerciser(std::move(exerciser));

    const auto started = std::chrono::steady_clock::now();
    symptomops::session::SessionReport report;
    std::string error;
    if (!orchestrator.Run(report, error)) {
      Fail("run failed: " + error);
    }
    CheckTimedOut(report, std::chrono::steady_clock::now() - started);
    if (!exerciser_view->StoppedEarly()) {
      Fail("exerciser should have been interrupted by the stop signal");
    }
  }

  // Without an exerciser the session collects until the timeout.
  {
    const auto session = symptomops::tests::common::MakeTestSession(
        temp_root / "out-none", {"uecm"}, {watched.string()}, kTimeout, kPollInterval);
    symptomops::session::SessionOrchestrator orchestrator(session, client, logger);

    const auto started = std::chrono::steady_clock::now();
    symptomops::session::SessionReport report;
    std::string error;
    if (!orchestrator.Run(report, error)) {
      Fail("run failed: " + error);
    }
    CheckTimedOut(report, std::chrono::steady_clock::now() - started);
    if (report.exerciser_exit_code.has_value()) {
      Fail("no exerciser exit code expected");
    }
  }

  RemovePathBestEffort(temp_root);
  return 0;
}
