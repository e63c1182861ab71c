#include "artifacts/error_report_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace symptomops::artifacts {

bool WriteErrorReportJson(const session::SessionReport& report, const fs::path& output_dir,
                          fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  std::ostringstream out;
  out << "{\n"
      << "  \"session_id\":" << core::QuoteJson(report.session_id) << ",\n"
      << "  \"total_events\":" << report.total_events << ",\n"
      << "  \"events_by_source\":{";
  bool first = true;
  for (const auto& [source, count] : report.events_by_source) {
    if (!first) {
      out << ',';
    }
    out << "\n    " << core::QuoteJson(source) << ':' << count;
    first = false;
  }
  out << "\n  },\n"
      << "  \"events\":[";
  for (std::size_t i = 0; i < report.events.size(); ++i) {
    const session::ErrorEvent& event = report.events[i];
    if (i != 0U) {
      out << ',';
    }
    out << "\n    {\"ts_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(event.timestamp))
        << ",\"source\":" << core::QuoteJson(event.source)
        << ",\"message\":" << core::QuoteJson(event.message) << "}";
  }
  out << "\n  ]\n"
      << "}\n";

  written_path = output_dir / "error_report.json";
  return core::WriteTextFileAtomic(written_path, out.str(), error);
}

} // namespace symptomops::artifacts
