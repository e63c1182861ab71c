#pragma once

#include "cluster/cluster_client.hpp"
#include "core/logging/logger.hpp"
#include "events/emitter.hpp"
#include "session/collection_session.hpp"
#include "session/error_aggregator.hpp"
#include "session/session_report.hpp"
#include "session/stop_signal.hpp"
#include "session/task_registry.hpp"
#include "session/wait_group.hpp"
#include "sources/evidence_source.hpp"
#include "watch/log_watcher.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace symptomops::session {

// Drives one collection session end to end:
//
//   Created -> Validating -> Collecting -> Exercising -> Draining -> Closed
//                   \-> ValidationFailed
//
// Validation is the only fatal step: when it fails no task is started, the
// aggregator channel is never created and no bundle directory is written.
// After that every task is best-effort. The stop signal is broadcast once,
// every task is joined through the wait group, and only then is the
// aggregator channel closed, so no producer can write to a closed channel.
//
// One orchestrator runs one session; Run() is single-use.
class SessionOrchestrator {
public:
  SessionOrchestrator(CollectionSession session, cluster::ClusterClient& cluster,
                      core::logging::Logger& logger);
  ~SessionOrchestrator();

  SessionOrchestrator(const SessionOrchestrator&) = delete;
  SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

  // Trace/capture style sources, started when collection begins.
  void AddSource(std::unique_ptr<sources::EvidenceSource> source);

  // The source whose Run() returning ends the Exercising phase. Without one
  // the phase ends at the timeout or on interrupt.
  void SetExerciser(std::unique_ptr<sources::EvidenceSource> exerciser);

  // Polled while exercising; a true value ends the phase as interrupted.
  void SetInterruptFlag(const std::atomic<bool>* interrupt_flag);

  // Contract:
  // - true: the session reached Closed; `report` is complete (it may still
  //   carry non-fatal issues).
  // - false: the session ended in ValidationFailed (report.final_state says
  //   so) or could not run at all; `error` explains why.
  bool Run(SessionReport& report, std::string& error);

  SessionState State() const;
  const CollectionSession& session() const {
    return session_;
  }

private:
  void TransitionTo(SessionState next);
  void AddIssue(IssueKind kind, std::string source, std::string message);
  void Emit(events::EventType type, std::map<std::string, std::string> payload);
  void EmitTaskEvent(events::EventType type, TaskId id);

  bool StartSource(sources::EvidenceSource& source, bool is_exerciser);
  bool StartWatcher(watch::LogWatcher& watcher);
  bool SpawnTask(TaskId id, std::function<void()> body);

  void RunSourceTask(TaskId id, sources::EvidenceSource& source, bool is_exerciser);
  void RunWatcherTask(TaskId id, watch::LogWatcher& watcher);
  void FinishTask(TaskId id, const std::string& name);

  EndReason WaitForExercisingEnd();
  void StopAllTasks();
  void CollectArtifacts(std::vector<std::filesystem::path>& written);
  void WriteBundle(SessionReport& report);
  void FillReport(SessionReport& report);

  const CollectionSession session_;
  cluster::ClusterClient& cluster_;
  core::logging::Logger& logger_;
  const std::atomic<bool>* interrupt_flag_ = nullptr;

  std::vector<std::unique_ptr<sources::EvidenceSource>> sources_;
  std::unique_ptr<sources::EvidenceSource> exerciser_;
  sources::SourceContext context_;

  mutable std::mutex state_mu_;
  SessionState state_ = SessionState::kCreated;
  std::vector<StateTransition> state_history_;

  std::mutex issues_mu_;
  std::vector<SessionIssue> issues_;

  preflight::PreflightReport preflight_;
  std::unique_ptr<events::Emitter> emitter_;
  std::atomic<bool> emit_failure_logged_{false};

  ReportBufferSink report_sink_;
  std::unique_ptr<LoggerSink> logger_sink_;
  std::unique_ptr<EmitterSink> emitter_sink_;
  std::unique_ptr<ErrorAggregator> aggregator_;
  ChannelStats channel_stats_;

  std::vector<std::unique_ptr<watch::LogWatcher>> watchers_;
  TaskRegistry registry_;
  WaitGroup wait_group_;
  StopSignal stop_;
  CompletionSignal exerciser_done_;
  std::vector<std::thread> threads_;
  std::atomic<bool> ran_{false};
};

} // namespace symptomops::session
