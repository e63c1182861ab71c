#pragma once

#include "session/session_report.hpp"

#include <filesystem>
#include <string>

namespace symptomops::artifacts {

// Writes `<output_dir>/error_report.json`: total event count, per-source
// counts (every monitored path, zeros included) and the ordered event list.
//
// Contract:
// - creates `output_dir` when missing.
// - returns false and sets `error` on failure.
bool WriteErrorReportJson(const session::SessionReport& report,
                          const std::filesystem::path& output_dir,
                          std::filesystem::path& written_path, std::string& error);

} // namespace symptomops::artifacts
