#include "events/emitter.hpp"

#include <utility>

namespace symptomops::events {

namespace {

std::string JoinFragments(const std::vector<std::string>& fragments) {
  std::string joined;
  for (const auto& fragment : fragments) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += fragment;
  }
  return joined;
}

} // namespace

Emitter::Emitter(std::filesystem::path output_dir) : log_(std::move(output_dir)) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);

  std::lock_guard<std::mutex> lock(mu_);
  return log_.Append(event, error);
}

bool Emitter::EmitSessionStarted(const SessionStartedEvent& event, std::string& error) {
  return EmitRaw(EventType::kSessionStarted, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"namespace", event.namespace_name},
                     {"pod_fragments", JoinFragments(event.pod_fragments)},
                     {"timeout_ms", std::to_string(event.timeout_ms)},
                     {"poll_interval_ms", std::to_string(event.poll_interval_ms)},
                     {"monitored_path_count", std::to_string(event.monitored_path_count)},
                 },
                 error);
}

bool Emitter::EmitTaskLifecycle(EventType type, const TaskLifecycleEvent& event,
                                std::string& error) {
  if (type != EventType::kTaskStarted && type != EventType::kTaskStopped) {
    error = "task lifecycle event requires task_started or task_stopped type";
    return false;
  }
  std::map<std::string, std::string> payload = {
      {"session_id", event.session_id},
      {"task_kind", event.task_kind},
      {"task_name", event.task_name},
  };
  if (type == EventType::kTaskStopped) {
    payload["failed"] = event.failed ? "true" : "false";
    if (!event.error.empty()) {
      payload["error"] = event.error;
    }
  }
  return EmitRaw(type, event.ts, std::move(payload), error);
}

bool Emitter::EmitErrorDetected(const ErrorDetectedEvent& event, std::string& error) {
  return EmitRaw(EventType::kErrorDetected, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"source", event.source},
                     {"message", event.message},
                     {"sequence", std::to_string(event.sequence)},
                 },
                 error);
}

bool Emitter::EmitSessionClosed(const SessionClosedEvent& event, std::string& error) {
  return EmitRaw(EventType::kSessionClosed, event.ts,
                 {
                     {"session_id", event.session_id},
                     {"end_reason", event.end_reason},
                     {"total_events", std::to_string(event.total_events)},
                     {"issue_count", std::to_string(event.issue_count)},
                     {"duration_ms", std::to_string(event.duration_ms)},
                 },
                 error);
}

std::filesystem::path Emitter::EventsPath() const {
  std::lock_guard<std::mutex> lock(mu_);
  return log_.path();
}

std::uint64_t Emitter::EventsWritten() const {
  std::lock_guard<std::mutex> lock(mu_);
  return log_.LinesWritten();
}

} // namespace symptomops::events
