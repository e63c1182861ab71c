#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace symptomops::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kSessionStarted:
    return "session_started";
  case EventType::kValidationPassed:
    return "validation_passed";
  case EventType::kValidationFailed:
    return "validation_failed";
  case EventType::kStateChanged:
    return "state_changed";
  case EventType::kTaskStarted:
    return "task_started";
  case EventType::kTaskStopped:
    return "task_stopped";
  case EventType::kSourceEnableFailed:
    return "source_enable_failed";
  case EventType::kWatchError:
    return "watch_error";
  case EventType::kErrorDetected:
    return "error_detected";
  case EventType::kExerciserCompleted:
    return "exerciser_completed";
  case EventType::kTimeoutExceeded:
    return "timeout_exceeded";
  case EventType::kInterrupted:
    return "interrupted";
  case EventType::kSessionClosed:
    return "session_closed";
  case EventType::kWarning:
    return "warning";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  // `payload` is a std::map, so key iteration order is stable.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << core::QuoteJson(key) << ':' << core::QuoteJson(value);
    first = false;
  }
  out << "}}";
  return out.str();
}

} // namespace symptomops::events
