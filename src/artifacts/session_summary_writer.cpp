#include "artifacts/session_summary_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace symptomops::artifacts {

namespace {

void WriteReadinessSection(std::ofstream& out_file, const session::SessionReport& report) {
  out_file << "## Target Readiness\n\n";
  if (report.preflight.deployments.empty()) {
    out_file << "- No deployment resolved.\n\n";
    return;
  }
  out_file << "| Fragment | Deployment | Ready |\n";
  out_file << "| --- | --- | --- |\n";
  for (const auto& readiness : report.preflight.deployments) {
    out_file << "| " << readiness.fragment << " | " << readiness.deployment_name << " | "
             << readiness.ready_replicas << "/" << readiness.desired_replicas << " |\n";
  }
  out_file << '\n';
}

void WriteWarningsSection(std::ofstream& out_file, const session::SessionReport& report) {
  out_file << "## Warnings\n\n";
  if (report.issues.empty()) {
    out_file << "- None.\n\n";
    return;
  }
  for (const auto& issue : report.issues) {
    out_file << "- `" << session::ToString(issue.kind) << "` " << issue.source << ": "
             << issue.message << '\n';
  }
  out_file << '\n';
}

} // namespace

bool WriteSessionSummaryMarkdown(const session::SessionReport& report, const fs::path& output_dir,
                                 fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  written_path = output_dir / "summary.md";
  std::ofstream out_file(written_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open output file '" + written_path.string() + "' for writing";
    return false;
  }

  const bool partial = report.HasIssue(session::IssueKind::kPartialCollectionError) ||
                       report.HasIssue(session::IssueKind::kSourceEnableError) ||
                       report.HasIssue(session::IssueKind::kWatchError);

  out_file << "# Symptom Collection Summary\n\n";
  out_file << "## Status\n\n";
  out_file << "**" << (partial ? "CLOSED WITH WARNINGS" : "CLOSED") << "**\n\n";

  out_file << "## Session\n\n";
  out_file << "- session_id: `" << report.session_id << "`\n";
  out_file << "- namespace: `" << report.namespace_name << "`\n";
  out_file << "- end_reason: `" << session::ToString(report.end_reason) << "`\n";
  if (report.exerciser_exit_code.has_value()) {
    out_file << "- exerciser_exit_code: `" << report.exerciser_exit_code.value() << "`\n";
  }
  out_file << "- started_at_utc: `" << core::FormatUtcTimestamp(report.started_at) << "`\n";
  out_file << "- finished_at_utc: `" << core::FormatUtcTimestamp(report.finished_at) << "`\n";
  out_file << "- duration: `" << core::FormatDuration(report.duration) << "`\n\n";

  WriteReadinessSection(out_file, report);

  out_file << "## Detected Errors\n\n";
  out_file << "Total: **" << report.total_events << "**\n\n";
  out_file << "| Source | Events |\n";
  out_file << "| --- | --- |\n";
  for (const auto& [source, count] : report.events_by_source) {
    out_file << "| " << source << " | " << count << " |\n";
  }
  out_file << '\n';

  out_file << "## Tasks\n\n";
  out_file << "| Task | Kind | State | Result |\n";
  out_file << "| --- | --- | --- | --- |\n";
  for (const auto& task : report.tasks) {
    out_file << "| " << task.name << " | " << session::ToString(task.kind) << " | "
             << session::ToString(task.state) << " | " << (task.failed ? "failed" : "ok")
             << " |\n";
  }
  out_file << '\n';

  WriteWarningsSection(out_file, report);

  if (!out_file) {
    error = "failed while writing output file '" + written_path.string() + "'";
    return false;
  }

  return true;
}

} // namespace symptomops::artifacts
