#include "events/jsonl_writer.hpp"

#include "core/fs_utils.hpp"

#include <utility>

namespace fs = std::filesystem;

namespace symptomops::events {

JsonlEventLog::JsonlEventLog(fs::path output_dir) : output_dir_(std::move(output_dir)) {}

bool JsonlEventLog::EnsureOpen(std::string& error) {
  if (out_.is_open() && out_.good()) {
    return true;
  }
  if (!core::EnsureDirectory(output_dir_, error)) {
    return false;
  }

  const fs::path target = output_dir_ / "events.jsonl";
  out_.close();
  out_.clear();
  out_.open(target, std::ios::binary | std::ios::app);
  if (!out_) {
    error = "failed to open event log '" + target.string() + "' for append";
    return false;
  }
  path_ = target;
  return true;
}

bool JsonlEventLog::Append(const Event& event, std::string& error) {
  if (!EnsureOpen(error)) {
    return false;
  }

  out_ << ToJson(event) << '\n';
  out_.flush();
  if (!out_) {
    error = "failed while writing event log '" + path_.string() + "'";
    return false;
  }
  ++lines_written_;
  return true;
}

} // namespace symptomops::events
