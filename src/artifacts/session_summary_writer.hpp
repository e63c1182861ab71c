#pragma once

#include "session/session_report.hpp"

#include <filesystem>
#include <string>

namespace symptomops::artifacts {

// Writes a one-page human-readable session summary (`summary.md`).
//
// Contract:
// - creates `output_dir` when missing.
// - writes `<output_dir>/summary.md`.
// - includes status, per-source counts, readiness and warnings.
// - returns false and sets `error` on failure.
bool WriteSessionSummaryMarkdown(const session::SessionReport& report,
                                 const std::filesystem::path& output_dir,
                                 std::filesystem::path& written_path, std::string& error);

} // namespace symptomops::artifacts
