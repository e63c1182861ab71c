#include "session/collection_session.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>
#include <utility>

namespace symptomops::session {

std::string MakeSessionId(std::chrono::system_clock::time_point now) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "session-" + std::to_string(millis);
}

bool MakeCollectionSession(const CollectionInputs& inputs,
                           std::chrono::system_clock::time_point now,
                           CollectionSession& session,
                           std::string& error) {
  error.clear();
  if (inputs.namespace_name.empty()) {
    error = "namespace cannot be empty";
    return false;
  }
  if (inputs.pod_fragments.empty()) {
    error = "at least one pod fragment is required";
    return false;
  }
  for (std::size_t i = 0; i < inputs.pod_fragments.size(); ++i) {
    if (inputs.pod_fragments[i].empty()) {
      error = "pod fragment #" + std::to_string(i) + " is empty";
      return false;
    }
  }
  if (inputs.timeout.count() <= 0) {
    error = "collection timeout must be positive";
    return false;
  }
  if (inputs.poll_interval.count() <= 0) {
    error = "poll interval must be positive";
    return false;
  }
  if (inputs.channel_capacity == 0U) {
    error = "channel capacity must be at least 1";
    return false;
  }
  if (inputs.keywords.empty()) {
    error = "at least one error keyword is required";
    return false;
  }
  if (inputs.output_root.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  CollectionSession built;
  built.session_id = MakeSessionId(now);
  built.namespace_name = inputs.namespace_name;
  built.pod_fragments = inputs.pod_fragments;
  built.started_at = now;
  built.timeout = inputs.timeout;
  built.poll_interval = inputs.poll_interval;
  built.keywords = inputs.keywords;
  built.monitored_paths = inputs.monitored_paths;
  built.channel_capacity = inputs.channel_capacity;
  built.bundle_dir = inputs.output_root / built.session_id;
  session = std::move(built);
  return true;
}

std::string ToJson(const CollectionSession& session) {
  std::ostringstream out;
  out << "{"
      << "\"session_id\":" << core::QuoteJson(session.session_id) << ","
      << "\"namespace\":" << core::QuoteJson(session.namespace_name) << ","
      << "\"pod_fragments\":" << core::ToJsonStringArray(session.pod_fragments) << ","
      << "\"started_at_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(session.started_at))
      << ","
      << "\"timeout_ms\":" << session.timeout.count() << ","
      << "\"poll_interval_ms\":" << session.poll_interval.count() << ","
      << "\"keywords\":" << core::ToJsonStringArray(session.keywords) << ","
      << "\"monitored_paths\":" << core::ToJsonStringArray(session.monitored_paths) << ","
      << "\"channel_capacity\":" << session.channel_capacity << ","
      << "\"bundle_dir\":" << core::QuoteJson(session.bundle_dir.string()) << "}";
  return out.str();
}

} // namespace symptomops::session
