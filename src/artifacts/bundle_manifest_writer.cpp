#include "artifacts/bundle_manifest_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace symptomops::artifacts {

namespace {

constexpr std::uint64_t kFnv1a64OffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnv1a64Prime = 1099511628211ULL;
constexpr const char* kManifestFileName = "bundle_manifest.json";

bool ComputeFileFnv1a64(const fs::path& file_path, std::string& hash_hex, std::string& error) {
  std::ifstream in_file(file_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open file for hashing: " + file_path.string();
    return false;
  }

  std::uint64_t hash = kFnv1a64OffsetBasis;
  char buffer[4096];
  while (in_file.good()) {
    in_file.read(buffer, sizeof(buffer));
    const std::streamsize read_count = in_file.gcount();
    for (std::streamsize i = 0; i < read_count; ++i) {
      hash ^= static_cast<std::uint64_t>(static_cast<std::uint8_t>(buffer[i]));
      hash *= kFnv1a64Prime;
    }
  }
  if (!in_file.eof()) {
    error = "failed while reading file for hashing: " + file_path.string();
    return false;
  }

  std::ostringstream out;
  out << std::hex << std::nouppercase << std::setw(16) << std::setfill('0') << hash;
  hash_hex = out.str();
  return true;
}

bool IsManifestCandidate(const fs::directory_entry& entry) {
  std::error_code ec;
  if (!entry.is_regular_file(ec) || ec) {
    return false;
  }
  const std::string name = entry.path().filename().string();
  return name != kManifestFileName && name.find(".tmp.") == std::string::npos;
}

} // namespace

bool ScanBundleFiles(const fs::path& bundle_dir, std::vector<ManifestEntry>& entries,
                     std::string& error) {
  entries.clear();
  std::error_code ec;
  if (!fs::is_directory(bundle_dir, ec)) {
    error = "bundle directory not found: " + bundle_dir.string();
    return false;
  }

  for (fs::recursive_directory_iterator it(bundle_dir, ec), end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    if (!IsManifestCandidate(*it)) {
      continue;
    }
    ManifestEntry entry;
    entry.relative_path = fs::relative(it->path(), bundle_dir, ec).generic_string();
    if (ec || entry.relative_path.empty()) {
      error = "failed to compute artifact path relative to bundle: " + it->path().string();
      return false;
    }
    entry.size_bytes = it->file_size(ec);
    if (ec) {
      error = "failed to read file size for artifact: " + it->path().string();
      return false;
    }
    if (!ComputeFileFnv1a64(it->path(), entry.hash_hex, error)) {
      return false;
    }
    entries.push_back(std::move(entry));
  }
  if (ec) {
    error = "failed to walk bundle directory '" + bundle_dir.string() + "': " + ec.message();
    return false;
  }

  std::sort(entries.begin(), entries.end(), [](const ManifestEntry& lhs, const ManifestEntry& rhs) {
    return lhs.relative_path < rhs.relative_path;
  });
  return true;
}

bool WriteBundleManifestJson(const fs::path& bundle_dir, const std::string& session_id,
                             fs::path& written_path, std::vector<fs::path>& listed,
                             std::string& error) {
  listed.clear();
  std::vector<ManifestEntry> entries;
  if (!ScanBundleFiles(bundle_dir, entries, error)) {
    return false;
  }

  std::uintmax_t total_bytes = 0;
  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\":\"1.0\",\n"
      << "  \"session_id\":" << core::QuoteJson(session_id) << ",\n"
      << "  \"generated_at_utc\":"
      << core::QuoteJson(core::FormatUtcTimestamp(std::chrono::system_clock::now())) << ",\n"
      << "  \"hash_algorithm\":\"fnv1a_64\",\n"
      << "  \"file_count\":" << entries.size() << ",\n"
      << "  \"files\":[";
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const ManifestEntry& entry = entries[i];
    if (i != 0U) {
      out << ",";
    }
    out << "\n    {\"path\":" << core::QuoteJson(entry.relative_path) << ","
        << "\"size_bytes\":" << entry.size_bytes << ","
        << "\"hash\":\"" << entry.hash_hex << "\"}";
    total_bytes += entry.size_bytes;
  }
  out << "\n  ],\n"
      << "  \"total_bytes\":" << total_bytes << "\n"
      << "}\n";

  written_path = bundle_dir / kManifestFileName;
  if (!core::WriteTextFileAtomic(written_path, out.str(), error)) {
    return false;
  }
  listed.reserve(entries.size());
  for (const auto& entry : entries) {
    listed.push_back(bundle_dir / fs::path(entry.relative_path));
  }
  return true;
}

} // namespace symptomops::artifacts
