#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "cluster/snapshot_client.hpp"
#include "core/logging/logger.hpp"
#include "session/session_orchestrator.hpp"

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

// Runs one session against `client` and checks that nothing started and no
// bundle was written. Returns the validation error text.
std::string RunExpectingValidationFailure(symptomops::cluster::SnapshotClusterClient& client,
                                          const fs::path& out_root, const fs::path& watched) {
  std::ostringstream log_output;
  symptomops::core::logging::Logger logger(symptomops::core::logging::LogLevel::kInfo,
                                           log_output);

  symptomops::session::CollectionSession session =
      symptomops::tests::common::MakeTestSession(out_root, {"uecm"}, {watched.string()});
  symptomops::session::SessionOrchestrator orchestrator(session, client, logger);

  auto trace = std::make_unique<symptomops::tests::common::FakeSource>(
      symptomops::session::TaskKind::kTrace, "trace");
  auto* trace_view = trace.get();
  orchestrator.AddSource(std::move(trace));
  orchestrator.SetExerciser(
      std::make_unique<symptomops::tests::common::TimedExerciser>(std::chrono::milliseconds(0)));

  symptomops::session::SessionReport report;
  std::string error;
  if (orchestrator.Run(report, error)) {
    Fail("run must fail when preflight validation fails");
  }
  if (error.empty() || report.validation_error != error) {
    Fail("validation error must be reported to the caller");
  }
  if (orchestrator.State() != SessionState::kValidationFailed ||
      report.final_state != SessionState::kValidationFailed) {
    Fail("session must end in ValidationFailed");
  }
  if (report.end_reason != EndReason::kValidationFailed) {
    Fail("unexpected end reason after validation failure");
  }
  if (!report.HasIssue(IssueKind::kValidationError)) {
    Fail("validation error issue missing");
  }
  if (report.TasksStarted() != 0U || trace_view->EnableCalls() != 0) {
    Fail("no task may start when validation fails");
  }
  if (report.total_events != 0U || report.channel.close_calls != 0U) {
    Fail("no channel activity expected when validation fails");
  }
  if (fs::exists(session.bundle_dir) || fs::exists(out_root)) {
    Fail("validation failure must not create a bundle directory");
  }
  if (!report.bundle_dir.empty()) {
    Fail("report must not point at a bundle");
  }

  std::string rerun_error;
  if (orchestrator.Run(report, rerun_error)) {
    Fail("orchestrator must be single-use");
  }
  AssertContains(rerun_error, "already ran");
  AssertContains(log_output.str(), "preflight validation failed");
  return error;
}

} // namespace

int main() {
  using symptomops::tests::common::CreateUniqueTempDir;
  using symptomops::tests::common::RemovePathBestEffort;
  using symptomops::tests::common::TouchFile;

  const fs::path temp_root = CreateUniqueTempDir("symptomops-validation-failure");
  const fs::path watched = temp_root / "app.log";
  TouchFile(watched);

  // Namespace `default` exists but holds no deployment matching `uecm`.
  {
    symptomops::cluster::SnapshotClusterClient client;
    symptomops::tests::common::SeedReadyCluster(client, {"tsp-core", "envoy-proxy"});
    const std::string error = RunExpectingValidationFailure(client, temp_root / "out-a", watched);
    AssertContains(error, "no deployment matching 'uecm' in namespace 'default'");
  }

  // Namespace missing entirely.
  {
    symptomops::cluster::SnapshotClusterClient client;
    client.AddNamespace("other");
    const std::string error = RunExpectingValidationFailure(client, temp_root / "out-b", watched);
    AssertContains(error, "namespace 'default' not found");
  }

  // Deployment present but not ready.
  {
    symptomops::cluster::SnapshotClusterClient client;
    client.AddNamespace("default");
    client.AddDeployment("default", symptomops::cluster::Deployment{.name = "uecm-core",
                                                                    .ready_replicas = 0,
                                                                    .desired_replicas = 2});
    const std::string error = RunExpectingValidationFailure(client, temp_root / "out-c", watched);
    AssertContains(error, "uecm-core");
  }

  // Cluster unreachable.
  {
    symptomops::cluster::SnapshotClusterClient client;
    client.SetUnavailable("connection refused");
    const std::string error = RunExpectingValidationFailure(client, temp_root / "out-d", watched);
    AssertContains(error, "connection refused");
  }

  RemovePathBestEffort(temp_root);
  return 0;
}
