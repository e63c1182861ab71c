#include "session/session_orchestrator.hpp"

#include "artifacts/bundle_manifest_writer.hpp"
#include "artifacts/error_report_writer.hpp"
#include "artifacts/session_summary_writer.hpp"
#include "artifacts/session_writer.hpp"
#include "preflight/validator.hpp"

#include <algorithm>
#include <cstdint>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace symptomops::session {

SessionOrchestrator::SessionOrchestrator(CollectionSession session,
                                         cluster::ClusterClient& cluster,
                                         core::logging::Logger& logger)
    : session_(std::move(session)), cluster_(cluster), logger_(logger) {
  context_.session = &session_;
  state_history_.push_back({.state = SessionState::kCreated,
                            .at = std::chrono::system_clock::now()});
}

SessionOrchestrator::~SessionOrchestrator() {
  // Only reached with live threads when Run() bailed out mid-session.
  (void)stop_.Request();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

void SessionOrchestrator::AddSource(std::unique_ptr<sources::EvidenceSource> source) {
  if (source != nullptr) {
    sources_.push_back(std::move(source));
  }
}

void SessionOrchestrator::SetExerciser(std::unique_ptr<sources::EvidenceSource> exerciser) {
  exerciser_ = std::move(exerciser);
}

void SessionOrchestrator::SetInterruptFlag(const std::atomic<bool>* interrupt_flag) {
  interrupt_flag_ = interrupt_flag;
}

SessionState SessionOrchestrator::State() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return state_;
}

void SessionOrchestrator::TransitionTo(SessionState next) {
  SessionState previous = SessionState::kCreated;
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    previous = state_;
    state_ = next;
    state_history_.push_back({.state = next, .at = std::chrono::system_clock::now()});
  }
  logger_.Info("session state changed",
               {{"from", ToString(previous)}, {"to", ToString(next)}});
  Emit(events::EventType::kStateChanged,
       {{"session_id", session_.session_id}, {"from", ToString(previous)}, {"to", ToString(next)}});
}

void SessionOrchestrator::AddIssue(IssueKind kind, std::string source, std::string message) {
  logger_.Warn("session issue",
               {{"kind", ToString(kind)}, {"source", source}, {"message", message}});
  std::lock_guard<std::mutex> lock(issues_mu_);
  issues_.push_back({.kind = kind, .source = std::move(source), .message = std::move(message)});
}

void SessionOrchestrator::Emit(events::EventType type,
                               std::map<std::string, std::string> payload) {
  if (emitter_ == nullptr) {
    return;
  }
  std::string error;
  if (!emitter_->EmitRaw(type, std::chrono::system_clock::now(), std::move(payload), error) &&
      !emit_failure_logged_.exchange(true)) {
    logger_.Warn("failed to append timeline event", {{"error", error}});
  }
}

void SessionOrchestrator::EmitTaskEvent(events::EventType type, TaskId id) {
  if (emitter_ == nullptr) {
    return;
  }
  const std::vector<TaskRecord> tasks = registry_.Snapshot();
  if (id >= tasks.size()) {
    return;
  }
  const TaskRecord& record = tasks[id];
  std::string error;
  if (!emitter_->EmitTaskLifecycle(type,
                                   {
                                       .ts = std::chrono::system_clock::now(),
                                       .session_id = session_.session_id,
                                       .task_kind = ToString(record.kind),
                                       .task_name = record.name,
                                       .failed = record.failed,
                                       .error = record.error,
                                   },
                                   error) &&
      !emit_failure_logged_.exchange(true)) {
    logger_.Warn("failed to append timeline event", {{"error", error}});
  }
}

bool SessionOrchestrator::Run(SessionReport& report, std::string& error) {
  error.clear();
  if (ran_.exchange(true)) {
    error = "session orchestrator already ran; create a new one for another session";
    return false;
  }

  logger_.SetSessionId(session_.session_id);
  TransitionTo(SessionState::kValidating);

  std::string validation_error;
  if (!preflight::ValidatePreflight(cluster_, session_.namespace_name, session_.pod_fragments,
                                    preflight_, validation_error)) {
    TransitionTo(SessionState::kValidationFailed);
    logger_.Error("preflight validation failed",
                  {{"failure", preflight::ToString(preflight_.failure)},
                   {"error", validation_error}});
    {
      std::lock_guard<std::mutex> lock(issues_mu_);
      issues_.push_back({.kind = IssueKind::kValidationError,
                         .source = "preflight",
                         .message = validation_error});
    }
    FillReport(report);
    report.end_reason = EndReason::kValidationFailed;
    report.validation_error = validation_error;
    error = validation_error;
    return false;
  }

  for (const auto& readiness : preflight_.deployments) {
    context_.targets.push_back(
        {.fragment = readiness.fragment, .deployment = readiness.deployment_name});
  }

  // The bundle directory comes into existence with the first event below.
  emitter_ = std::make_unique<events::Emitter>(session_.bundle_dir);
  std::string emit_error;
  if (!emitter_->EmitSessionStarted(
          {
              .ts = session_.started_at,
              .session_id = session_.session_id,
              .namespace_name = session_.namespace_name,
              .pod_fragments = session_.pod_fragments,
              .timeout_ms = static_cast<std::uint64_t>(session_.timeout.count()),
              .poll_interval_ms = static_cast<std::uint64_t>(session_.poll_interval.count()),
              .monitored_path_count = session_.monitored_paths.size(),
          },
          emit_error)) {
    logger_.Warn("failed to append timeline event", {{"error", emit_error}});
    emit_failure_logged_ = true;
  }
  Emit(events::EventType::kValidationPassed,
       {{"session_id", session_.session_id},
        {"deployments", std::to_string(preflight_.deployments.size())}});

  logger_sink_ = std::make_unique<LoggerSink>(logger_);
  emitter_sink_ = std::make_unique<EmitterSink>(*emitter_, session_.session_id, logger_);
  aggregator_ = std::make_unique<ErrorAggregator>(
      session_.channel_capacity,
      std::vector<ErrorEventSink*>{&report_sink_, logger_sink_.get(), emitter_sink_.get()});
  if (!aggregator_->Start(error)) {
    logger_.Error("failed to start error aggregator", {{"error", error}});
    FillReport(report);
    return false;
  }

  TransitionTo(SessionState::kCollecting);
  for (auto& source : sources_) {
    (void)StartSource(*source, false);
  }
  const watch::KeywordMatcher matcher(session_.keywords);
  for (const auto& path : session_.monitored_paths) {
    watchers_.push_back(std::make_unique<watch::LogWatcher>(
        path, matcher, session_.poll_interval, aggregator_->MakeWriter(path), logger_));
    (void)StartWatcher(*watchers_.back());
  }

  TransitionTo(SessionState::kExercising);
  if (exerciser_ != nullptr) {
    (void)StartSource(*exerciser_, true);
  } else {
    logger_.Warn("no exerciser configured; collecting until timeout or interrupt");
  }
  const EndReason end_reason = WaitForExercisingEnd();

  TransitionTo(SessionState::kDraining);
  StopAllTasks();

  std::vector<fs::path> collected;
  CollectArtifacts(collected);

  // Every producer has stopped; closing now cannot race a Send.
  channel_stats_.closed_after_all_tasks_stopped = registry_.AllStopped();
  if (!aggregator_->Close()) {
    AddIssue(IssueKind::kPartialCollectionError, "aggregator",
             "error channel was already closed before draining");
  }
  channel_stats_.capacity = aggregator_->Capacity();
  channel_stats_.high_water_mark = aggregator_->HighWaterMark();
  channel_stats_.blocked_sends = aggregator_->BlockedSends();
  channel_stats_.sends_after_close = aggregator_->SendsAfterClose();
  channel_stats_.close_calls = aggregator_->CloseCalls();

  if (emitter_sink_->WriteFailures() > 0U) {
    AddIssue(IssueKind::kPartialCollectionError, "events.jsonl",
             std::to_string(emitter_sink_->WriteFailures()) +
                 " error_detected event(s) could not be written");
  }

  TransitionTo(SessionState::kClosed);
  FillReport(report);
  report.end_reason = end_reason;
  report.artifacts = std::move(collected);

  std::string close_error;
  if (!emitter_->EmitSessionClosed(
          {
              .ts = report.finished_at,
              .session_id = session_.session_id,
              .end_reason = ToString(end_reason),
              .total_events = report.total_events,
              .issue_count = report.issues.size(),
              .duration_ms = static_cast<std::uint64_t>(report.duration.count()),
          },
          close_error) &&
      !emit_failure_logged_.exchange(true)) {
    logger_.Warn("failed to append timeline event", {{"error", close_error}});
  }

  WriteBundle(report);
  logger_.Info("session closed",
               {{"end_reason", ToString(end_reason)},
                {"total_events", std::to_string(report.total_events)},
                {"issues", std::to_string(report.issues.size())},
                {"bundle", session_.bundle_dir.string()}});
  return true;
}

bool SessionOrchestrator::SpawnTask(TaskId id, std::function<void()> body) {
  wait_group_.Add();
  try {
    threads_.emplace_back(std::move(body));
  } catch (const std::system_error& ex) {
    std::string ignored;
    registry_.MarkFailed(id, std::string("failed to spawn task thread: ") + ex.what());
    (void)registry_.Transition(id, TaskState::kStopped, ignored);
    (void)wait_group_.Done(ignored);
    AddIssue(IssueKind::kPartialCollectionError, "task",
             std::string("failed to spawn task thread: ") + ex.what());
    return false;
  }
  return true;
}

bool SessionOrchestrator::StartSource(sources::EvidenceSource& source, bool is_exerciser) {
  const TaskId id = registry_.Register(source.Kind(), source.Name());
  return SpawnTask(id, [this, id, &source, is_exerciser] {
    RunSourceTask(id, source, is_exerciser);
  });
}

bool SessionOrchestrator::StartWatcher(watch::LogWatcher& watcher) {
  const TaskId id = registry_.Register(TaskKind::kLogWatcher, watcher.path());
  return SpawnTask(id, [this, id, &watcher] { RunWatcherTask(id, watcher); });
}

void SessionOrchestrator::RunSourceTask(TaskId id, sources::EvidenceSource& source,
                                        bool is_exerciser) {
  const std::string name = source.Name();
  std::string error;
  (void)registry_.Transition(id, TaskState::kRunning, error);
  EmitTaskEvent(events::EventType::kTaskStarted, id);

  if (!source.Enable(context_, error)) {
    registry_.MarkFailed(id, "enable: " + error);
    AddIssue(IssueKind::kSourceEnableError, name, error);
    Emit(events::EventType::kSourceEnableFailed,
         {{"session_id", session_.session_id}, {"task_name", name}, {"error", error}});
    std::string disable_error;
    (void)registry_.Transition(id, TaskState::kStopping, disable_error);
    if (!source.Disable(context_, disable_error)) {
      registry_.MarkFailed(id, "disable: " + disable_error);
      AddIssue(IssueKind::kPartialCollectionError, name, "disable failed: " + disable_error);
    }
    FinishTask(id, name);
    return;
  }

  if (!source.Run(context_, stop_, error)) {
    registry_.MarkFailed(id, "run: " + error);
    AddIssue(IssueKind::kPartialCollectionError, name, "run failed: " + error);
  }
  if (is_exerciser) {
    const std::optional<int> code = source.CompletionCode();
    exerciser_done_.Complete(code.value_or(0));
    if (!stop_.IsRequested()) {
      Emit(events::EventType::kExerciserCompleted,
           {{"session_id", session_.session_id},
            {"exit_code", code.has_value() ? std::to_string(code.value()) : "none"}});
      if (code.has_value() && code.value() != 0) {
        logger_.Warn("exerciser finished with non-zero exit code",
                     {{"exit_code", std::to_string(code.value())}});
      }
    }
  }

  (void)registry_.Transition(id, TaskState::kStopping, error);
  if (!source.Disable(context_, error)) {
    registry_.MarkFailed(id, "disable: " + error);
    AddIssue(IssueKind::kPartialCollectionError, name, "disable failed: " + error);
  }
  FinishTask(id, name);
}

void SessionOrchestrator::RunWatcherTask(TaskId id, watch::LogWatcher& watcher) {
  std::string error;
  (void)registry_.Transition(id, TaskState::kRunning, error);
  EmitTaskEvent(events::EventType::kTaskStarted, id);
  if (!watcher.Run(stop_, error)) {
    registry_.MarkFailed(id, error);
    AddIssue(IssueKind::kPartialCollectionError, watcher.path(), error);
  }
  (void)registry_.Transition(id, TaskState::kStopping, error);
  FinishTask(id, watcher.path());
}

void SessionOrchestrator::FinishTask(TaskId id, const std::string& name) {
  std::string error;
  (void)registry_.Transition(id, TaskState::kStopped, error);
  EmitTaskEvent(events::EventType::kTaskStopped, id);
  if (!wait_group_.Done(error)) {
    logger_.Error("task bookkeeping mismatch", {{"task", name}, {"error", error}});
  }
}

EndReason SessionOrchestrator::WaitForExercisingEnd() {
  const auto deadline = std::chrono::steady_clock::now() + session_.timeout;
  while (true) {
    if (interrupt_flag_ != nullptr && interrupt_flag_->load()) {
      logger_.Warn("interrupt received; stopping collection");
      Emit(events::EventType::kInterrupted, {{"session_id", session_.session_id}});
      return EndReason::kInterrupted;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      const std::string timeout_text = std::to_string(session_.timeout.count());
      AddIssue(IssueKind::kTimeoutExceeded, "session",
               "exerciser did not complete within " + timeout_text + "ms");
      Emit(events::EventType::kTimeoutExceeded,
           {{"session_id", session_.session_id}, {"timeout_ms", timeout_text}});
      return EndReason::kTimeout;
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const auto slice = std::max(std::chrono::milliseconds(1),
                                std::min(remaining, session_.poll_interval));
    if (exerciser_ != nullptr && exerciser_done_.WaitFor(slice)) {
      return EndReason::kExerciserCompleted;
    }
    if (exerciser_ == nullptr) {
      (void)stop_.WaitFor(slice);
    }
  }
}

void SessionOrchestrator::StopAllTasks() {
  (void)stop_.Request();
  logger_.Info("stop requested; waiting for tasks",
               {{"pending", std::to_string(wait_group_.Pending())}});
  wait_group_.Wait();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

void SessionOrchestrator::CollectArtifacts(std::vector<fs::path>& written) {
  auto collect = [this, &written](sources::EvidenceSource& source) {
    std::string error;
    if (!source.CollectArtifacts(context_, session_.bundle_dir, written, error)) {
      AddIssue(IssueKind::kPartialCollectionError, source.Name(),
               "artifact collection failed: " + error);
    }
  };
  for (auto& source : sources_) {
    collect(*source);
  }
  if (exerciser_ != nullptr) {
    collect(*exerciser_);
  }

  const fs::path watched_dir = session_.bundle_dir / "watched";
  for (const auto& watcher : watchers_) {
    if (watcher->WatchErrorCount() > 0U) {
      const std::string message = watcher->LastWatchError() + " (" +
                                  std::to_string(watcher->WatchErrorCount()) +
                                  " unavailable period(s))";
      AddIssue(IssueKind::kWatchError, watcher->path(), message);
      Emit(events::EventType::kWatchError, {{"session_id", session_.session_id},
                                            {"path", watcher->path()},
                                            {"error", message}});
    }
    fs::path slice_path;
    std::string error;
    if (!watcher->ExportSessionSlice(watched_dir, slice_path, error)) {
      AddIssue(IssueKind::kPartialCollectionError, watcher->path(),
               "failed to export watched slice: " + error);
      continue;
    }
    if (!slice_path.empty()) {
      written.push_back(slice_path);
    }
  }
}

void SessionOrchestrator::FillReport(SessionReport& report) {
  report = SessionReport{};
  report.session_id = session_.session_id;
  report.namespace_name = session_.namespace_name;
  report.pod_fragments = session_.pod_fragments;
  report.monitored_paths = session_.monitored_paths;
  report.started_at = session_.started_at;
  report.finished_at = std::chrono::system_clock::now();
  report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(report.finished_at -
                                                                           report.started_at);
  report.timeout = session_.timeout;
  report.final_state = State();
  if (exerciser_ != nullptr) {
    report.exerciser_exit_code = exerciser_->CompletionCode();
  }

  report.events = report_sink_.Events();
  report.total_events = report.events.size();
  for (const auto& path : session_.monitored_paths) {
    report.events_by_source[path] = 0;
  }
  for (const auto& [source, count] : report_sink_.CountsBySource()) {
    report.events_by_source[source] = count;
  }

  report.preflight = preflight_;
  report.tasks = registry_.Snapshot();
  {
    std::lock_guard<std::mutex> lock(issues_mu_);
    report.issues = issues_;
  }
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    report.state_history = state_history_;
  }
  report.channel = channel_stats_;
  if (report.final_state != SessionState::kValidationFailed) {
    report.bundle_dir = session_.bundle_dir;
  }
}

void SessionOrchestrator::WriteBundle(SessionReport& report) {
  fs::path written;
  std::string error;
  if (!artifacts::WriteErrorReportJson(report, session_.bundle_dir, written, error)) {
    AddIssue(IssueKind::kPartialCollectionError, "error_report.json", error);
  }
  if (!artifacts::WriteSessionSummaryMarkdown(report, session_.bundle_dir, written, error)) {
    AddIssue(IssueKind::kPartialCollectionError, "summary.md", error);
  }
  if (!artifacts::WriteSessionJson(session_, report, session_.bundle_dir, written, error)) {
    AddIssue(IssueKind::kPartialCollectionError, "session.json", error);
  }

  std::vector<fs::path> files;
  fs::path manifest_path;
  if (!artifacts::WriteBundleManifestJson(session_.bundle_dir, session_.session_id, manifest_path,
                                          files, error)) {
    AddIssue(IssueKind::kPartialCollectionError, "bundle_manifest.json", error);
  }

  // Late write failures belong in the in-memory report even though the files
  // on disk could not record them.
  std::lock_guard<std::mutex> lock(issues_mu_);
  report.issues = issues_;
  report.artifacts = files;
  if (!manifest_path.empty()) {
    report.artifacts.push_back(manifest_path);
  }
}

} // namespace symptomops::session
