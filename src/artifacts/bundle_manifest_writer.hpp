#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace symptomops::artifacts {

struct ManifestEntry {
  // Relative to the bundle root, `/`-separated (`watched/_var_log_Envoy.log`).
  std::string relative_path;
  std::uintmax_t size_bytes = 0;
  std::string hash_hex;
};

// Walks `bundle_dir` recursively and returns every regular file except the
// manifest itself and leftover `.tmp.` files from interrupted atomic writes,
// sorted by relative path. Each file is hashed with FNV-1a 64-bit.
bool ScanBundleFiles(const std::filesystem::path& bundle_dir, std::vector<ManifestEntry>& entries,
                     std::string& error);

// Writes `<bundle_dir>/bundle_manifest.json` for a closed session bundle.
//
// Contract:
// - the manifest lists what is on disk at call time, so it must be written
//   after every other bundle file.
// - true: `written_path` is the manifest and `listed` holds the absolute
//   path of every file it describes.
// - false: `error` explains why; nothing is written when the scan failed.
bool WriteBundleManifestJson(const std::filesystem::path& bundle_dir,
                             const std::string& session_id,
                             std::filesystem::path& written_path,
                             std::vector<std::filesystem::path>& listed, std::string& error);

} // namespace symptomops::artifacts
