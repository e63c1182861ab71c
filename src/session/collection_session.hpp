#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace symptomops::session {

// Caller-provided inputs for one collection session.
struct CollectionInputs {
  std::string namespace_name;
  std::vector<std::string> pod_fragments;
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds poll_interval{0};
  std::vector<std::string> keywords;
  std::vector<std::string> monitored_paths;
  std::size_t channel_capacity = 100;
  // Parent directory; the bundle lands in `<output_root>/<session_id>/`.
  std::filesystem::path output_root;
};

// One diagnostic collection session. Built once by MakeCollectionSession and
// only handed out by const reference afterwards.
struct CollectionSession {
  std::string session_id;
  std::string namespace_name;
  std::vector<std::string> pod_fragments;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds poll_interval{0};
  std::vector<std::string> keywords;
  std::vector<std::string> monitored_paths;
  std::size_t channel_capacity = 100;
  std::filesystem::path bundle_dir;
};

// Builds `session-<unix-millis>` from `now`.
std::string MakeSessionId(std::chrono::system_clock::time_point now);

// Validates inputs and freezes them into a session.
//
// Contract:
// - true: `session` is populated and `error` is empty.
// - false: an input is unusable (empty namespace, no fragment, empty
//   fragment, non-positive timeout/poll interval, zero capacity, no keyword);
//   `error` names the first offending field.
bool MakeCollectionSession(const CollectionInputs& inputs,
                           std::chrono::system_clock::time_point now,
                           CollectionSession& session,
                           std::string& error);

// Canonical key ordering for session.json and test assertions.
std::string ToJson(const CollectionSession& session);

} // namespace symptomops::session
