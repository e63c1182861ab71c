#include "session/task_registry.hpp"

#include <utility>

namespace symptomops::session {

const char* ToString(TaskKind kind) {
  switch (kind) {
  case TaskKind::kTrace:
    return "trace";
  case TaskKind::kCapture:
    return "capture";
  case TaskKind::kExerciser:
    return "exerciser";
  case TaskKind::kLogWatcher:
    return "log_watcher";
  }
  return "unknown";
}

const char* ToString(TaskState state) {
  switch (state) {
  case TaskState::kStarting:
    return "starting";
  case TaskState::kRunning:
    return "running";
  case TaskState::kStopping:
    return "stopping";
  case TaskState::kStopped:
    return "stopped";
  }
  return "unknown";
}

TaskId TaskRegistry::Register(TaskKind kind, std::string name) {
  std::lock_guard<std::mutex> lock(mu_);
  TaskRecord record;
  record.id = tasks_.size();
  record.kind = kind;
  record.name = std::move(name);
  record.started_at = std::chrono::system_clock::now();
  tasks_.push_back(std::move(record));
  return tasks_.back().id;
}

bool TaskRegistry::Transition(TaskId id, TaskState next, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (id >= tasks_.size()) {
    error = "unknown task id " + std::to_string(id);
    return false;
  }
  TaskRecord& record = tasks_[id];
  if (static_cast<int>(next) <= static_cast<int>(record.state)) {
    error = "task '" + record.name + "' cannot move from " + ToString(record.state) + " to " +
            ToString(next);
    return false;
  }
  record.state = next;
  if (next == TaskState::kStopped) {
    record.stopped_at = std::chrono::system_clock::now();
  }
  return true;
}

void TaskRegistry::MarkFailed(TaskId id, const std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (id >= tasks_.size()) {
    return;
  }
  TaskRecord& record = tasks_[id];
  record.failed = true;
  if (!record.error.empty()) {
    record.error += "; ";
  }
  record.error += error;
}

std::vector<TaskRecord> TaskRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return tasks_;
}

std::size_t TaskRegistry::Count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return tasks_.size();
}

bool TaskRegistry::AllStopped() const {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& record : tasks_) {
    if (record.state != TaskState::kStopped) {
      return false;
    }
  }
  return true;
}

} // namespace symptomops::session
