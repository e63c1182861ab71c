#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace symptomops::config {

struct ClusterSettings {
  std::string namespace_name = "default";
  std::string kubeconfig_path;
  std::chrono::milliseconds request_timeout{30'000};
};

struct SymptomSettings {
  std::vector<std::string> error_keywords;
  std::chrono::milliseconds check_interval{1'000};
  std::chrono::milliseconds collection_timeout{600'000};
  std::size_t channel_capacity = 100;
};

struct PodCommandSettings {
  std::string enable;
  std::string disable;
  std::string collect;
};

struct SourcesSettings {
  PodCommandSettings trace;
  PodCommandSettings capture;
  std::string exerciser_command;
};

// Effective collector configuration: defaults, then config file, then
// SYMPTOMOPS_* environment, then CLI flags.
struct CollectorConfig {
  ClusterSettings cluster;
  SymptomSettings symptom;
  std::vector<std::string> log_paths;
  std::string log_level = "info";
  std::string output_dir = "out";
  SourcesSettings sources;
  // Config file the values came from; empty when only defaults applied.
  std::string loaded_from;
};

struct ConfigIssue {
  std::string path;
  std::string message;
};

struct ConfigReport {
  bool valid = false;
  std::vector<ConfigIssue> issues;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::vector<std::string> DefaultErrorKeywords();
std::vector<std::string> DefaultLogPaths();
CollectorConfig DefaultCollectorConfig();

// Reads the real process environment.
EnvLookup ProcessEnvironment();

// Accepts `<n>ms`, `<n>s`, `<n>m`, `<n>h` with a non-negative integer `n`.
bool ParseDurationText(std::string_view text, std::chrono::milliseconds& out, std::string& error);

// Shortest exact rendering (`1500ms`, `30s`, `10m`, `2h`).
std::string FormatDurationText(std::chrono::milliseconds duration);

// Config search order used when no explicit `-c` path is given.
std::vector<std::filesystem::path> DefaultConfigSearchPaths(const EnvLookup& env);

// Returns the first existing search path, or std::nullopt.
std::optional<std::filesystem::path> ResolveConfigPath(const EnvLookup& env);

// Overlays JSON config text onto `config`. Keys that are absent keep their
// current value.
//
// Contract:
// - Returns true when the text was processed, even with issues; each type
//   mismatch or unknown key lands in `report.issues` as `path: message`.
// - Returns false only when the text is not valid JSON (`error` carries the
//   parser's line/column diagnostic).
bool ApplyConfigJson(std::string_view json_text, CollectorConfig& config, ConfigReport& report,
                     std::string& error);

// Loads a config file and overlays it on `config`.
//
// Contract:
// - false: file I/O or JSON parse failure; `error` explains why.
// - true: `config.loaded_from` is set and `report` holds any issues.
bool LoadCollectorConfigFile(const std::filesystem::path& config_path, CollectorConfig& config,
                             ConfigReport& report, std::string& error);

// SYMPTOMOPS_NAMESPACE, SYMPTOMOPS_LOG_LEVEL, SYMPTOMOPS_KUBECONFIG_PATH and
// SYMPTOMOPS_OUTPUT_DIR override the matching keys when set and non-empty.
void ApplyEnvironmentOverrides(const EnvLookup& env, CollectorConfig& config);

// Checks the effective values and appends every problem to `report`;
// `report.valid` reflects the final issue list.
void ValidateCollectorConfig(const CollectorConfig& config, ConfigReport& report);

} // namespace symptomops::config
