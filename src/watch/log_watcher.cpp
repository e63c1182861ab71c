#include "watch/log_watcher.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <new>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace symptomops::watch {

namespace {

constexpr std::size_t kReadChunkBytes = 64 * 1024;
// A line longer than this is emitted in pieces of this size.
constexpr std::size_t kMaxHeldLineBytes = 1024 * 1024;
// Bytes read per poll; a larger backlog is picked up by the following polls.
constexpr std::uintmax_t kMaxBytesPerPoll = 32 * 1024 * 1024;
constexpr std::size_t kMaxEventMessageBytes = 4 * 1024;

} // namespace

LogWatcher::LogWatcher(std::string path, KeywordMatcher matcher,
                       std::chrono::milliseconds poll_interval, session::ChannelWriter writer,
                       core::logging::Logger& logger)
    : path_(std::move(path)), matcher_(std::move(matcher)), poll_interval_(poll_interval),
      writer_(std::move(writer)), logger_(logger) {
  std::error_code ec;
  const fs::file_status status = fs::status(path_, ec);
  if (ec || !fs::exists(status)) {
    // Anything written once the path appears is new.
    return;
  }
  if (fs::is_directory(status)) {
    is_directory_ = true;
    for (fs::directory_iterator it(path_, ec), end; !ec && it != end; it.increment(ec)) {
      known_entries_.insert(it->path().filename().string());
    }
    return;
  }
  const std::uintmax_t size = fs::file_size(path_, ec);
  if (!ec) {
    offset_ = size;
    slice_start_ = size;
  }
}

bool LogWatcher::Run(const session::StopSignal& stop, std::string& error) {
  if (ran_.exchange(true)) {
    error = "log watcher for '" + path_ + "' already ran; create a new instance to restart";
    return false;
  }

  logger_.Debug("log watcher started", {{"path", path_}});
  while (!stop.WaitFor(poll_interval_)) {
    GuardedPoll(false);
    if (channel_closed_) {
      break;
    }
  }
  GuardedPoll(true);
  logger_.Debug("log watcher stopped", {{"path", path_}, {"matched", std::to_string(MatchedCount())}});
  return true;
}

void LogWatcher::GuardedPoll(bool final_poll) {
  try {
    Poll(final_poll);
  } catch (const std::bad_alloc&) {
    std::string().swap(partial_line_);
    ReportWatchError("out of memory while reading appended bytes");
  } catch (const std::exception& ex) {
    ReportWatchError(std::string("poll failed: ") + ex.what());
  }
}

void LogWatcher::Poll(bool final_poll) {
  if (channel_closed_) {
    return;
  }

  std::error_code ec;
  const fs::file_status status = fs::status(path_, ec);
  if (ec || !fs::exists(status)) {
    ReportWatchError(ec ? ec.message() : "path does not exist");
    return;
  }

  if (fs::is_directory(status)) {
    if (!is_directory_) {
      is_directory_ = true;
      offset_ = 0;
      partial_line_.clear();
    }
    PollDirectory();
    return;
  }

  if (is_directory_) {
    // The directory was replaced by a file; its content is all new.
    logger_.Info("watched directory replaced by a file", {{"path", path_}});
    is_directory_ = false;
    known_entries_.clear();
    new_entries_.clear();
    offset_ = 0;
    slice_start_ = 0;
    partial_line_.clear();
  }

  const std::uintmax_t size = fs::file_size(path_, ec);
  if (ec) {
    ReportWatchError(ec.message());
    return;
  }
  PollFile(size, final_poll);
}

void LogWatcher::PollFile(std::uintmax_t size, bool final_poll) {
  if (size < offset_) {
    ++truncations_;
    logger_.Info("watched file truncated; rereading from start",
                 {{"path", path_},
                  {"previous_offset", std::to_string(offset_)},
                  {"size", std::to_string(size)}});
    offset_ = 0;
    slice_start_ = 0;
    partial_line_.clear();
  }

  if (size > offset_) {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
      ReportWatchError("failed to open for reading");
      return;
    }
    in.seekg(static_cast<std::streamoff>(offset_), std::ios::beg);
    std::uintmax_t remaining = std::min(size - offset_, kMaxBytesPerPoll);
    std::string chunk(kReadChunkBytes, '\0');
    while (remaining > 0U && !channel_closed_) {
      const std::size_t wanted =
          static_cast<std::size_t>(std::min<std::uintmax_t>(remaining, kReadChunkBytes));
      in.read(chunk.data(), static_cast<std::streamsize>(wanted));
      const std::streamsize got = in.gcount();
      if (got <= 0) {
        ReportWatchError("failed to read appended bytes");
        return;
      }
      offset_ += static_cast<std::uintmax_t>(got);
      remaining -= static_cast<std::uintmax_t>(got);
      partial_line_.append(chunk.data(), static_cast<std::size_t>(got));
      ScanLines(false);
      if (partial_line_.size() >= kMaxHeldLineBytes && !channel_closed_) {
        std::string held;
        held.swap(partial_line_);
        EmitLine(held);
      }
    }
  }

  ClearWatchError();
  ScanLines(final_poll);
}

void LogWatcher::ScanLines(bool final_poll) {
  std::size_t line_start = 0;
  while (!channel_closed_) {
    const std::size_t newline = partial_line_.find('\n', line_start);
    if (newline == std::string::npos) {
      break;
    }
    std::string line = partial_line_.substr(line_start, newline - line_start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    line_start = newline + 1;
    EmitLine(line);
  }
  partial_line_.erase(0, line_start);

  if (final_poll && !partial_line_.empty() && !channel_closed_) {
    std::string tail;
    tail.swap(partial_line_);
    EmitLine(tail);
  }
}

void LogWatcher::EmitLine(const std::string& line) {
  ++lines_scanned_;
  if (!matcher_.Matches(line)) {
    return;
  }
  const bool sent =
      line.size() <= kMaxEventMessageBytes
          ? writer_.Send(line)
          : writer_.Send(line.substr(0, kMaxEventMessageBytes) + " [truncated " +
                         std::to_string(line.size() - kMaxEventMessageBytes) + " bytes]");
  if (!sent) {
    channel_closed_ = true;
    logger_.Warn("aggregator channel closed; log watcher stops emitting", {{"path", path_}});
    return;
  }
  ++matched_;
}

void LogWatcher::PollDirectory() {
  std::error_code ec;
  std::set<std::string> current;
  for (fs::directory_iterator it(path_, ec), end; !ec && it != end; it.increment(ec)) {
    current.insert(it->path().filename().string());
  }
  if (ec) {
    ReportWatchError(ec.message());
    return;
  }
  ClearWatchError();

  for (const auto& name : current) {
    if (channel_closed_) {
      return;
    }
    if (known_entries_.count(name) != 0U) {
      continue;
    }
    known_entries_.insert(name);
    new_entries_.insert(name);
    ++lines_scanned_;
    if (!writer_.Send("new entry in " + path_ + ": " + name)) {
      channel_closed_ = true;
      return;
    }
    ++matched_;
  }
}

void LogWatcher::ReportWatchError(const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(error_mu_);
    last_watch_error_ = message;
  }
  if (in_error_) {
    return;
  }
  in_error_ = true;
  ++watch_errors_;
  logger_.Warn("watch path unavailable", {{"path", path_}, {"error", message}});
}

void LogWatcher::ClearWatchError() {
  if (!in_error_) {
    return;
  }
  in_error_ = false;
  logger_.Info("watch path available again", {{"path", path_}});
}

std::string LogWatcher::LastWatchError() const {
  std::lock_guard<std::mutex> lock(error_mu_);
  return last_watch_error_;
}

bool LogWatcher::ExportSessionSlice(const fs::path& watched_dir, fs::path& written_path,
                                    std::string& error) const {
  written_path.clear();
  const std::string base_name = core::SanitizePathForFileName(path_);

  if (is_directory_) {
    if (new_entries_.empty()) {
      return true;
    }
    std::ostringstream listing;
    for (const auto& name : new_entries_) {
      listing << name << '\n';
    }
    const fs::path target = watched_dir / (base_name + ".entries.txt");
    if (!core::WriteTextFileAtomic(target, listing.str(), error)) {
      return false;
    }
    written_path = target;
    return true;
  }

  std::error_code ec;
  if (!fs::is_regular_file(path_, ec) || offset_ <= slice_start_) {
    return true;
  }

  const fs::path target = watched_dir / (base_name + ".log");
  std::uintmax_t copied = 0;
  if (!core::CopyFileTail(path_, slice_start_, target, copied, error)) {
    return false;
  }
  written_path = target;
  return true;
}

} // namespace symptomops::watch
