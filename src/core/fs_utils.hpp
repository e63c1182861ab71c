#ifndef SYMPTOMOPS_CORE_FS_UTILS_HPP_
#define SYMPTOMOPS_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace symptomops::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

// Creates `dir` and any missing parents. Used by every bundle writer.
inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create output directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Best-effort atomic text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// A reader of the bundle never observes a half-written report.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

// Copies bytes [offset, EOF) of `source_path` into `output_path`. Used to keep
// only what a watched file gained during one session.
inline bool CopyFileTail(const std::filesystem::path& source_path, std::uintmax_t offset,
                         const std::filesystem::path& output_path, std::uintmax_t& copied_bytes,
                         std::string& error) {
  copied_bytes = 0;
  std::ifstream in_file(source_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open source file '" + source_path.string() + "'";
    return false;
  }
  in_file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!in_file) {
    error = "failed to seek source file '" + source_path.string() + "' to offset " +
            std::to_string(offset);
    return false;
  }

  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }
  std::ofstream out_file(output_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open output file '" + output_path.string() + "' for writing";
    return false;
  }

  char buffer[8192];
  while (in_file.good()) {
    in_file.read(buffer, sizeof(buffer));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      continue;
    }
    out_file.write(buffer, read_count);
    copied_bytes += static_cast<std::uintmax_t>(read_count);
  }
  if (in_file.bad()) {
    error = "failed while reading source file '" + source_path.string() + "'";
    return false;
  }
  if (!out_file) {
    error = "failed while writing output file '" + output_path.string() + "'";
    return false;
  }
  return true;
}

// Maps an absolute watched path such as `/logstore/TspCore` to a flat,
// shell-safe artifact name (`logstore_TspCore`).
inline std::string SanitizePathForFileName(std::string_view raw) {
  std::string name;
  name.reserve(raw.size());
  for (const char c : raw) {
    const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                      c == '-' || c == '.';
    name.push_back(keep ? c : '_');
  }
  const std::size_t first = name.find_first_not_of('_');
  if (first == std::string::npos) {
    return "root";
  }
  name.erase(0, first);
  while (!name.empty() && name.back() == '_') {
    name.pop_back();
  }
  return name;
}

} // namespace symptomops::core

#endif // SYMPTOMOPS_CORE_FS_UTILS_HPP_
