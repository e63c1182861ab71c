#pragma once

#include "core/logging/logger.hpp"
#include "session/error_aggregator.hpp"
#include "session/stop_signal.hpp"
#include "watch/keyword_matcher.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>

namespace symptomops::watch {

// Polls one monitored path and forwards matching lines to the aggregator.
//
// - Regular file: content present at construction is the baseline and is
//   never reported. Each poll reads the bytes appended since the previous
//   poll and emits one event per complete matching line, in file order. A
//   trailing partial line waits for its newline (flushed by the final poll).
//   A file that shrinks (truncation/rotation) is re-read from offset 0.
//   Appended bytes are read in bounded chunks. A line that grows past 1 MiB
//   without a newline is emitted in 1 MiB pieces, and event messages are
//   capped at 4 KiB.
// - Directory: every entry that appears after construction is one event.
// - Missing/unreadable path: logged once per transition, counted, and
//   polling continues.
//
// Run() is single-use; a restart needs a fresh instance.
class LogWatcher {
public:
  LogWatcher(std::string path, KeywordMatcher matcher, std::chrono::milliseconds poll_interval,
             session::ChannelWriter writer, core::logging::Logger& logger);

  LogWatcher(const LogWatcher&) = delete;
  LogWatcher& operator=(const LogWatcher&) = delete;

  // Polls every `poll_interval` until `stop` is requested, then runs one final
  // poll and returns. Returns false (without polling) when called twice.
  bool Run(const session::StopSignal& stop, std::string& error);

  // Copies what the file gained during the session into
  // `<watched_dir>/<sanitized-path>.log` (directories: a listing of the new
  // entries). `written_path` stays empty when there was nothing to export.
  bool ExportSessionSlice(const std::filesystem::path& watched_dir,
                          std::filesystem::path& written_path,
                          std::string& error) const;

  const std::string& path() const {
    return path_;
  }
  std::uint64_t MatchedCount() const {
    return matched_.load();
  }
  std::uint64_t LinesScanned() const {
    return lines_scanned_.load();
  }
  std::uint64_t WatchErrorCount() const {
    return watch_errors_.load();
  }
  std::uint64_t TruncationCount() const {
    return truncations_.load();
  }
  std::string LastWatchError() const;

private:
  void GuardedPoll(bool final_poll);
  void Poll(bool final_poll);
  void PollFile(std::uintmax_t size, bool final_poll);
  void PollDirectory();
  void ScanLines(bool final_poll);
  void EmitLine(const std::string& line);
  void ReportWatchError(const std::string& message);
  void ClearWatchError();

  const std::string path_;
  const KeywordMatcher matcher_;
  const std::chrono::milliseconds poll_interval_;
  session::ChannelWriter writer_;
  core::logging::Logger& logger_;

  std::atomic<bool> ran_{false};
  bool channel_closed_ = false;
  bool in_error_ = false;

  bool is_directory_ = false;
  std::uintmax_t offset_ = 0;
  std::uintmax_t slice_start_ = 0;
  std::string partial_line_;
  std::set<std::string> known_entries_;
  std::set<std::string> new_entries_;

  std::atomic<std::uint64_t> matched_{0};
  std::atomic<std::uint64_t> lines_scanned_{0};
  std::atomic<std::uint64_t> watch_errors_{0};
  std::atomic<std::uint64_t> truncations_{0};
  mutable std::mutex error_mu_;
  std::string last_watch_error_;
};

} // namespace symptomops::watch
