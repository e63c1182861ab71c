#pragma once

#include "events/event_model.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace symptomops::events {

// Append-only `<output_dir>/events.jsonl`. The file is opened on the first
// append and stays open for the rest of the session; every line is flushed
// so a crash loses at most the line being written.
//
// Not thread-safe; Emitter serializes access.
class JsonlEventLog {
public:
  explicit JsonlEventLog(std::filesystem::path output_dir);

  JsonlEventLog(const JsonlEventLog&) = delete;
  JsonlEventLog& operator=(const JsonlEventLog&) = delete;

  // Writes exactly one line. After a write failure the stream is reopened on
  // the next call.
  bool Append(const Event& event, std::string& error);

  // Empty until the file was opened.
  const std::filesystem::path& path() const {
    return path_;
  }
  std::uint64_t LinesWritten() const {
    return lines_written_;
  }

private:
  bool EnsureOpen(std::string& error);

  const std::filesystem::path output_dir_;
  std::filesystem::path path_;
  std::ofstream out_;
  std::uint64_t lines_written_ = 0;
};

} // namespace symptomops::events
