#include "session/session_report.hpp"

namespace symptomops::session {

bool SessionReport::HasIssue(IssueKind kind) const {
  for (const auto& issue : issues) {
    if (issue.kind == kind) {
      return true;
    }
  }
  return false;
}

const char* ToString(SessionState state) {
  switch (state) {
  case SessionState::kCreated:
    return "created";
  case SessionState::kValidating:
    return "validating";
  case SessionState::kCollecting:
    return "collecting";
  case SessionState::kExercising:
    return "exercising";
  case SessionState::kDraining:
    return "draining";
  case SessionState::kClosed:
    return "closed";
  case SessionState::kValidationFailed:
    return "validation_failed";
  }
  return "unknown";
}

const char* ToString(EndReason reason) {
  switch (reason) {
  case EndReason::kNone:
    return "none";
  case EndReason::kExerciserCompleted:
    return "exerciser_completed";
  case EndReason::kTimeout:
    return "timeout";
  case EndReason::kInterrupted:
    return "interrupted";
  case EndReason::kValidationFailed:
    return "validation_failed";
  }
  return "unknown";
}

const char* ToString(IssueKind kind) {
  switch (kind) {
  case IssueKind::kValidationError:
    return "validation_error";
  case IssueKind::kSourceEnableError:
    return "source_enable_error";
  case IssueKind::kWatchError:
    return "watch_error";
  case IssueKind::kPartialCollectionError:
    return "partial_collection_error";
  case IssueKind::kTimeoutExceeded:
    return "timeout_exceeded";
  }
  return "unknown";
}

} // namespace symptomops::session
