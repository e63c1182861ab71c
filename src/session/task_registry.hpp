#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace symptomops::session {

enum class TaskKind {
  kTrace,
  kCapture,
  kExerciser,
  kLogWatcher,
};

// Forward-only lifecycle: Starting -> Running -> Stopping -> Stopped.
enum class TaskState {
  kStarting,
  kRunning,
  kStopping,
  kStopped,
};

using TaskId = std::size_t;

struct TaskRecord {
  TaskId id = 0;
  TaskKind kind = TaskKind::kTrace;
  std::string name;
  TaskState state = TaskState::kStarting;
  // Set when Enable failed or Run/Disable returned an error.
  bool failed = false;
  std::string error;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point stopped_at{};
};

const char* ToString(TaskKind kind);
const char* ToString(TaskState state);

// Thread-safe table of every task started in one session.
class TaskRegistry {
public:
  TaskRegistry() = default;
  TaskRegistry(const TaskRegistry&) = delete;
  TaskRegistry& operator=(const TaskRegistry&) = delete;

  TaskId Register(TaskKind kind, std::string name);

  // Moves a task forward. Backward or unknown transitions are rejected.
  bool Transition(TaskId id, TaskState next, std::string& error);

  void MarkFailed(TaskId id, const std::string& error);

  std::vector<TaskRecord> Snapshot() const;
  std::size_t Count() const;
  bool AllStopped() const;

private:
  mutable std::mutex mu_;
  std::vector<TaskRecord> tasks_;
};

} // namespace symptomops::session
