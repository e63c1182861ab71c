#pragma once

#include "session/collection_session.hpp"
#include "session/session_report.hpp"

#include <filesystem>
#include <string>

namespace symptomops::artifacts {

// Writes `<output_dir>/session.json`: session identity and inputs, lifecycle
// timestamps, final state, end reason, state history, preflight readiness and
// per-task outcomes.
//
// Contract:
// - creates `output_dir` when missing.
// - returns false and sets `error` on failure.
bool WriteSessionJson(const session::CollectionSession& collection,
                      const session::SessionReport& report,
                      const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

std::string ToJson(const session::SessionReport& report);

} // namespace symptomops::artifacts
