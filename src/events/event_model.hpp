#pragma once

#include <chrono>
#include <map>
#include <string>

namespace symptomops::events {

// Normalized timeline categories. Keep this enum compact and stable because
// report tooling keys off the serialized names.
enum class EventType {
  kSessionStarted,
  kValidationPassed,
  kValidationFailed,
  kStateChanged,
  kTaskStarted,
  kTaskStopped,
  kSourceEnableFailed,
  kWatchError,
  kErrorDetected,
  kExerciserCompleted,
  kTimeoutExceeded,
  kInterrupted,
  kSessionClosed,
  kWarning,
};

// Canonical timeline event contract.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: lightweight string key/value attributes for context.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kWarning;
  std::map<std::string, std::string> payload;
};

// JSON serializers used by JSONL writers and tests.
std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace symptomops::events
