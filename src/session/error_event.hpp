#pragma once

#include <chrono>
#include <string>

namespace symptomops::session {

// One detected error line. `source` is the watched path (or the evidence
// source name) that produced it.
struct ErrorEvent {
  std::chrono::system_clock::time_point timestamp{};
  std::string source;
  std::string message;
};

} // namespace symptomops::session
