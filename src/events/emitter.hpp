#pragma once

#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace symptomops::events {

// Thin event facade used by session orchestration to keep payload contracts
// consistent while still writing the same JSONL event format. Task threads
// and the aggregator consumer share one instance, so every append happens
// under one lock and lines never interleave.
class Emitter {
public:
  struct SessionStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::string namespace_name;
    std::vector<std::string> pod_fragments;
    std::uint64_t timeout_ms = 0;
    std::uint64_t poll_interval_ms = 0;
    std::uint64_t monitored_path_count = 0;
  };

  struct TaskLifecycleEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::string task_kind;
    std::string task_name;
    bool failed = false;
    std::string error;
  };

  struct ErrorDetectedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::string source;
    std::string message;
    std::uint64_t sequence = 0;
  };

  struct SessionClosedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string session_id;
    std::string end_reason;
    std::uint64_t total_events = 0;
    std::uint64_t issue_count = 0;
    std::uint64_t duration_ms = 0;
  };

  explicit Emitter(std::filesystem::path output_dir);

  Emitter(const Emitter&) = delete;
  Emitter& operator=(const Emitter&) = delete;

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error);

  bool EmitSessionStarted(const SessionStartedEvent& event, std::string& error);
  // `type` must be kTaskStarted or kTaskStopped.
  bool EmitTaskLifecycle(EventType type, const TaskLifecycleEvent& event, std::string& error);
  bool EmitErrorDetected(const ErrorDetectedEvent& event, std::string& error);
  bool EmitSessionClosed(const SessionClosedEvent& event, std::string& error);

  // Path of events.jsonl once the first event was written, empty before.
  std::filesystem::path EventsPath() const;
  std::uint64_t EventsWritten() const;

private:
  mutable std::mutex mu_;
  JsonlEventLog log_;
};

} // namespace symptomops::events
