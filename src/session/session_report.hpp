#pragma once

#include "preflight/validator.hpp"
#include "session/error_event.hpp"
#include "session/task_registry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace symptomops::session {

enum class SessionState {
  kCreated,
  kValidating,
  kCollecting,
  kExercising,
  kDraining,
  kClosed,
  kValidationFailed,
};

// Why the Exercising phase ended.
enum class EndReason {
  kNone,
  kExerciserCompleted,
  kTimeout,
  kInterrupted,
  kValidationFailed,
};

// Classified problems. Only kValidationError is fatal; every other kind is
// accumulated and the session still closes.
enum class IssueKind {
  kValidationError,
  kSourceEnableError,
  kWatchError,
  kPartialCollectionError,
  kTimeoutExceeded,
};

struct SessionIssue {
  IssueKind kind = IssueKind::kPartialCollectionError;
  std::string source;
  std::string message;
};

struct StateTransition {
  SessionState state = SessionState::kCreated;
  std::chrono::system_clock::time_point at{};
};

// Channel health captured right after the aggregator closed.
struct ChannelStats {
  std::size_t capacity = 0;
  std::size_t high_water_mark = 0;
  std::uint64_t blocked_sends = 0;
  std::uint64_t sends_after_close = 0;
  std::uint64_t close_calls = 0;
  bool closed_after_all_tasks_stopped = false;
};

// Final outcome of one session, produced exactly once by the orchestrator.
struct SessionReport {
  std::string session_id;
  std::string namespace_name;
  std::vector<std::string> pod_fragments;
  std::vector<std::string> monitored_paths;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
  std::chrono::milliseconds duration{0};
  std::chrono::milliseconds timeout{0};

  SessionState final_state = SessionState::kCreated;
  EndReason end_reason = EndReason::kNone;
  std::optional<int> exerciser_exit_code;
  std::string validation_error;

  std::uint64_t total_events = 0;
  // Every monitored path is present, zero counts included.
  std::map<std::string, std::uint64_t> events_by_source;
  std::vector<ErrorEvent> events;

  preflight::PreflightReport preflight;
  std::vector<TaskRecord> tasks;
  std::vector<SessionIssue> issues;
  std::vector<StateTransition> state_history;
  ChannelStats channel;

  // Empty when validation failed (no bundle is created).
  std::filesystem::path bundle_dir;
  std::vector<std::filesystem::path> artifacts;

  bool HasIssue(IssueKind kind) const;
  std::size_t TasksStarted() const {
    return tasks.size();
  }
};

const char* ToString(SessionState state);
const char* ToString(EndReason reason);
const char* ToString(IssueKind kind);

} // namespace symptomops::session
