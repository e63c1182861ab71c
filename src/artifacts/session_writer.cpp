#include "artifacts/session_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace symptomops::artifacts {

namespace {

std::string TaskToJson(const session::TaskRecord& task) {
  std::ostringstream out;
  out << "{"
      << "\"name\":" << core::QuoteJson(task.name) << ","
      << "\"kind\":" << core::QuoteJson(session::ToString(task.kind)) << ","
      << "\"state\":" << core::QuoteJson(session::ToString(task.state)) << ","
      << "\"failed\":" << (task.failed ? "true" : "false");
  if (!task.error.empty()) {
    out << ",\"error\":" << core::QuoteJson(task.error);
  }
  out << "}";
  return out.str();
}

} // namespace

std::string ToJson(const session::SessionReport& report) {
  std::ostringstream out;
  out << "{"
      << "\"session_id\":" << core::QuoteJson(report.session_id) << ","
      << "\"final_state\":" << core::QuoteJson(session::ToString(report.final_state)) << ","
      << "\"end_reason\":" << core::QuoteJson(session::ToString(report.end_reason)) << ","
      << "\"started_at_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(report.started_at))
      << ","
      << "\"finished_at_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(report.finished_at))
      << ","
      << "\"duration_ms\":" << report.duration.count() << ",";
  if (report.exerciser_exit_code.has_value()) {
    out << "\"exerciser_exit_code\":" << report.exerciser_exit_code.value() << ",";
  }
  out << "\"total_events\":" << report.total_events << ","
      << "\"preflight\":" << preflight::ToJson(report.preflight) << ","
      << "\"state_history\":[";
  for (std::size_t i = 0; i < report.state_history.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << "{\"state\":" << core::QuoteJson(session::ToString(report.state_history[i].state))
        << ",\"at_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(report.state_history[i].at))
        << "}";
  }
  out << "],\"tasks\":[";
  for (std::size_t i = 0; i < report.tasks.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << TaskToJson(report.tasks[i]);
  }
  out << "],\"issues\":[";
  for (std::size_t i = 0; i < report.issues.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << "{\"kind\":" << core::QuoteJson(session::ToString(report.issues[i].kind))
        << ",\"source\":" << core::QuoteJson(report.issues[i].source)
        << ",\"message\":" << core::QuoteJson(report.issues[i].message) << "}";
  }
  out << "],\"channel\":{"
      << "\"capacity\":" << report.channel.capacity << ","
      << "\"high_water_mark\":" << report.channel.high_water_mark << ","
      << "\"blocked_sends\":" << report.channel.blocked_sends << ","
      << "\"sends_after_close\":" << report.channel.sends_after_close << ","
      << "\"close_calls\":" << report.channel.close_calls << ","
      << "\"closed_after_all_tasks_stopped\":"
      << (report.channel.closed_after_all_tasks_stopped ? "true" : "false") << "}"
      << "}";
  return out.str();
}

bool WriteSessionJson(const session::CollectionSession& collection,
                      const session::SessionReport& report, const fs::path& output_dir,
                      fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  std::ostringstream out;
  out << "{\n"
      << "  \"session\":" << session::ToJson(collection) << ",\n"
      << "  \"outcome\":" << ToJson(report) << "\n"
      << "}\n";

  written_path = output_dir / "session.json";
  return core::WriteTextFileAtomic(written_path, out.str(), error);
}

} // namespace symptomops::artifacts
