#ifndef SYMPTOMOPS_TESTS_COMMON_CLI_FIXTURES_HPP_
#define SYMPTOMOPS_TESTS_COMMON_CLI_FIXTURES_HPP_

#include "assertions.hpp"
#include "core/json_utils.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace symptomops::tests::common {

inline void WriteTextFile(const std::filesystem::path& path, const std::string& text) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to write " + path.string());
  }
  out << text;
}

// Offline cluster: `default` holds ready `uecm-core` and `tsp-main`, plus a
// `rtp-relay` with no ready replica.
inline std::filesystem::path WriteClusterSnapshot(const std::filesystem::path& dir) {
  const std::filesystem::path path = dir / "cluster.json";
  WriteTextFile(path, R"({"namespaces":[{"name":"default","deployments":[
  {"name":"uecm-core","ready_replicas":1,"desired_replicas":1,
   "image":"registry.local/uecm:4.1","created_at":"2024-05-01T10:00:00Z"},
  {"name":"tsp-main","ready_replicas":2,"desired_replicas":2},
  {"name":"rtp-relay","ready_replicas":0,"desired_replicas":1,"image":""}]}]})");
  return path;
}

struct CliConfigOptions {
  std::vector<std::string> log_paths;
  std::string exerciser_command;
  std::string collection_timeout = "10s";
  std::string check_interval = "20ms";
  std::string output_dir = "out";
  std::string kubeconfig_path;
  std::string trace_enable;
};

inline std::filesystem::path WriteCliConfig(const std::filesystem::path& dir,
                                            const CliConfigOptions& options) {
  const std::filesystem::path path = dir / "symptomops.json";
  std::string text = "{\n";
  text += "  \"cluster\": {\"namespace\": \"default\", \"kubeconfig_path\": " +
          core::QuoteJson(options.kubeconfig_path) + ", \"request_timeout\": \"5s\"},\n";
  text += "  \"symptom\": {\"error_keywords\": [\"ERROR\"], \"check_interval\": " +
          core::QuoteJson(options.check_interval) +
          ", \"collection_timeout\": " + core::QuoteJson(options.collection_timeout) +
          ", \"channel_capacity\": 16},\n";
  text += "  \"paths\": {\"log_paths\": " + core::ToJsonStringArray(options.log_paths) + "},\n";
  text += "  \"logging\": {\"level\": \"debug\"},\n";
  text += "  \"output\": {\"dir\": " + core::QuoteJson(options.output_dir) + "},\n";
  text += "  \"sources\": {\"trace\": {\"enable\": " + core::QuoteJson(options.trace_enable) +
          ", \"disable\": \"\", \"collect\": \"\"}, \"exerciser\": {\"command\": " +
          core::QuoteJson(options.exerciser_command) + "}}\n";
  text += "}\n";
  WriteTextFile(path, text);
  return path;
}

// The single session bundle under `out_root`, or an empty path.
inline std::filesystem::path FindOnlyBundle(const std::filesystem::path& out_root) {
  std::error_code ec;
  std::filesystem::path found;
  for (std::filesystem::directory_iterator it(out_root, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_directory()) {
      continue;
    }
    if (!found.empty()) {
      Fail("more than one bundle under " + out_root.string());
    }
    found = it->path();
  }
  return found;
}

} // namespace symptomops::tests::common

#endif // SYMPTOMOPS_TESTS_COMMON_CLI_FIXTURES_HPP_
