#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "artifacts/error_report_writer.hpp"
#include "artifacts/session_summary_writer.hpp"
#include "artifacts/session_writer.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {

symptomops::session::SessionReport MakeClosedReport(
    const symptomops::session::CollectionSession& collection) {
  using symptomops::session::ErrorEvent;
  using symptomops::session::IssueKind;

  symptomops::session::SessionReport report;
  report.session_id = collection.session_id;
  report.namespace_name = collection.namespace_name;
  report.pod_fragments = collection.pod_fragments;
  report.monitored_paths = collection.monitored_paths;
  report.started_at = collection.started_at;
  report.finished_at = collection.started_at + std::chrono::milliseconds(1500);
  report.duration = std::chrono::milliseconds(1500);
  report.timeout = collection.timeout;
  report.final_state = symptomops::session::SessionState::kClosed;
  report.end_reason = symptomops::session::EndReason::kExerciserCompleted;
  report.exerciser_exit_code = 0;

  report.events = {
      ErrorEvent{.timestamp = collection.started_at, .source = "/var/log/TspCore.log",
                 .message = "ERROR \"quoted\" failure"},
      ErrorEvent{.timestamp = collection.started_at, .source = "/var/log/TspCore.log",
                 .message = "ERROR second"},
  };
  report.total_events = report.events.size();
  report.events_by_source = {{"/var/log/TspCore.log", 2}, {"/var/log/Envoy.log", 0}};

  report.preflight.namespace_name = collection.namespace_name;
  report.preflight.namespace_exists = true;
  report.preflight.deployments.push_back({.fragment = "uecm",
                                          .deployment_name = "uecm-core",
                                          .ready_replicas = 1,
                                          .desired_replicas = 1,
                                          .ready = true});
  report.tasks.push_back({.id = 1,
                          .kind = symptomops::session::TaskKind::kCapture,
                          .name = "capture",
                          .state = symptomops::session::TaskState::kStopped,
                          .failed = true,
                          .error = "tcpdump missing"});
  report.issues.push_back(
      {.kind = IssueKind::kSourceEnableError, .source = "capture", .message = "tcpdump missing"});
  report.channel.capacity = 100;
  report.channel.close_calls = 1;
  report.channel.closed_after_all_tasks_stopped = true;
  report.bundle_dir = collection.bundle_dir;
  return report;
}

} // namespace

int main() {
  using symptomops::tests::common::AssertContains;
  using symptomops::tests::common::AssertNotContains;
  using symptomops::tests::common::CreateUniqueTempDir;
  using symptomops::tests::common::Fail;
  using symptomops::tests::common::ReadFileToString;
  using symptomops::tests::common::RemovePathBestEffort;

  const fs::path temp_root = CreateUniqueTempDir("symptomops-session-artifacts");
  const symptomops::session::CollectionSession collection =
      symptomops::tests::common::MakeTestSession(temp_root, {"uecm"},
                                                 {"/var/log/TspCore.log", "/var/log/Envoy.log"});
  symptomops::session::SessionReport report = MakeClosedReport(collection);

  fs::path written;
  std::string error;

  if (!symptomops::artifacts::WriteErrorReportJson(report, collection.bundle_dir, written,
                                                   error)) {
    Fail("error report failed: " + error);
  }
  const std::string error_report = ReadFileToString(written);
  AssertContains(error_report, "\"total_events\":2");
  AssertContains(error_report, "\"/var/log/Envoy.log\":0");
  AssertContains(error_report, "\"/var/log/TspCore.log\":2");
  AssertContains(error_report, "\"message\":\"ERROR \\\"quoted\\\" failure\"");
  if (error_report.find("ERROR \\\"quoted") > error_report.find("ERROR second")) {
    Fail("events must keep consumption order");
  }

  if (!symptomops::artifacts::WriteSessionSummaryMarkdown(report, collection.bundle_dir, written,
                                                          error)) {
    Fail("summary failed: " + error);
  }
  const std::string summary = ReadFileToString(written);
  AssertContains(summary, "**CLOSED WITH WARNINGS**");
  AssertContains(summary, "- end_reason: `exerciser_completed`");
  AssertContains(summary, "- exerciser_exit_code: `0`");
  AssertContains(summary, "| uecm | uecm-core | 1/1 |");
  AssertContains(summary, "| /var/log/Envoy.log | 0 |");
  AssertContains(summary, "| capture | capture | stopped | failed |");
  AssertContains(summary, "- `source_enable_error` capture: tcpdump missing");

  if (!symptomops::artifacts::WriteSessionJson(collection, report, collection.bundle_dir, written,
                                               error)) {
    Fail("session.json failed: " + error);
  }
  const std::string session_json = ReadFileToString(written);
  AssertContains(session_json, "\"session_id\":\"" + collection.session_id + "\"");
  AssertContains(session_json, "\"final_state\":\"closed\"");
  AssertContains(session_json, "\"duration_ms\":1500");
  AssertContains(session_json, "\"closed_after_all_tasks_stopped\":true");
  AssertContains(session_json, "\"kind\":\"source_enable_error\"");

  // A clean session has no warnings and says so.
  report.issues.clear();
  report.tasks.clear();
  report.exerciser_exit_code.reset();
  report.end_reason = symptomops::session::EndReason::kTimeout;
  if (!symptomops::artifacts::WriteSessionSummaryMarkdown(report, collection.bundle_dir, written,
                                                          error)) {
    Fail("summary rewrite failed: " + error);
  }
  const std::string clean_summary = ReadFileToString(written);
  AssertContains(clean_summary, "**CLOSED**");
  AssertContains(clean_summary, "## Warnings\n\n- None.");
  AssertNotContains(clean_summary, "exerciser_exit_code");

  RemovePathBestEffort(temp_root);
  return 0;
}
