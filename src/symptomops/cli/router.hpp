#pragma once

#include "config/collector_config.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace symptomops::cli {

// Options shared by `collect`, `validate` and `list-deployments`. Unset
// optionals mean "keep the value resolved from config/environment".
struct CollectOptions {
  std::vector<std::string> pod_fragments;
  std::optional<std::string> namespace_name;
  std::optional<std::filesystem::path> config_path;
  std::optional<std::filesystem::path> output_dir;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<core::logging::LogLevel> log_level;
  std::optional<std::filesystem::path> cluster_snapshot_path;
};

// Splits `-p "uecm tsp"` style values on whitespace; empty tokens are dropped.
std::vector<std::string> SplitPodFragments(const std::string& raw);

// Layers defaults, the config file (explicit `-c` or the first search path
// that exists), SYMPTOMOPS_* environment overrides and finally CLI flags.
//
// Contract:
// - true: `config` is resolved and `report.valid` says whether it passed
//   validation; `report.issues` lists every problem found.
// - false: the config file could not be read or parsed; `error` says why.
bool ResolveEffectiveConfig(const CollectOptions& options, const config::EnvLookup& env,
                            config::CollectorConfig& config, config::ConfigReport& report,
                            std::string& error);

// Routes `symptomops` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success (session closed, partial collection errors included)
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config invalid
//   20 => preflight validation failed
//   30 => cluster could not be queried
int Dispatch(int argc, char** argv);

} // namespace symptomops::cli
