#include "config/collector_config.hpp"

#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace symptomops::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ConfigReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

// Flags keys outside `known`; typos in a config file otherwise go unnoticed.
void CheckUnknownKeys(const JsonValue& object, const std::string& prefix,
                      const std::set<std::string>& known, ConfigReport& report) {
  for (const auto& [key, value] : object.object_value) {
    (void)value;
    if (known.count(key) == 0U) {
      AddIssue(report, prefix.empty() ? key : prefix + "." + key, "unknown key");
    }
  }
}

const JsonValue* ObjectSection(const JsonValue& root, std::string_view key, ConfigReport& report) {
  const JsonValue* section = root.Find(key);
  if (section == nullptr) {
    return nullptr;
  }
  if (!section->IsObject()) {
    AddIssue(report, std::string(key), "must be an object");
    return nullptr;
  }
  return section;
}

void ReadString(const JsonValue& section, std::string_view key, const std::string& path,
                std::string& out, ConfigReport& report) {
  const JsonValue* value = section.Find(key);
  if (value == nullptr) {
    return;
  }
  if (!value->IsString()) {
    AddIssue(report, path, "must be a string");
    return;
  }
  out = value->string_value;
}

void ReadStringList(const JsonValue& section, std::string_view key, const std::string& path,
                    std::vector<std::string>& out, ConfigReport& report) {
  const JsonValue* value = section.Find(key);
  if (value == nullptr) {
    return;
  }
  if (!value->IsArray()) {
    AddIssue(report, path, "must be an array of strings");
    return;
  }
  std::vector<std::string> parsed;
  for (std::size_t i = 0; i < value->array_value.size(); ++i) {
    const JsonValue& item = value->array_value[i];
    if (!item.IsString()) {
      AddIssue(report, path + "[" + std::to_string(i) + "]", "must be a string");
      return;
    }
    parsed.push_back(item.string_value);
  }
  out = std::move(parsed);
}

void ReadDuration(const JsonValue& section, std::string_view key, const std::string& path,
                  std::chrono::milliseconds& out, ConfigReport& report) {
  const JsonValue* value = section.Find(key);
  if (value == nullptr) {
    return;
  }
  if (!value->IsString()) {
    AddIssue(report, path, "must be a duration string such as \"500ms\", \"1s\" or \"10m\"");
    return;
  }
  std::string error;
  std::chrono::milliseconds parsed{0};
  if (!ParseDurationText(value->string_value, parsed, error)) {
    AddIssue(report, path, error);
    return;
  }
  out = parsed;
}

void ReadCount(const JsonValue& section, std::string_view key, const std::string& path,
               std::size_t& out, ConfigReport& report) {
  const JsonValue* value = section.Find(key);
  if (value == nullptr) {
    return;
  }
  if (!value->IsNumber() || !std::isfinite(value->number_value) || value->number_value < 0.0 ||
      std::floor(value->number_value) != value->number_value ||
      value->number_value > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    AddIssue(report, path, "must be a non-negative integer");
    return;
  }
  out = static_cast<std::size_t>(value->number_value);
}

void ReadPodCommands(const JsonValue& sources, std::string_view key, PodCommandSettings& out,
                     ConfigReport& report) {
  const JsonValue* section = sources.Find(key);
  const std::string prefix = "sources." + std::string(key);
  if (section == nullptr) {
    return;
  }
  if (!section->IsObject()) {
    AddIssue(report, prefix, "must be an object");
    return;
  }
  CheckUnknownKeys(*section, prefix, {"enable", "disable", "collect"}, report);
  ReadString(*section, "enable", prefix + ".enable", out.enable, report);
  ReadString(*section, "disable", prefix + ".disable", out.disable, report);
  ReadString(*section, "collect", prefix + ".collect", out.collect, report);
}

} // namespace

std::vector<std::string> DefaultErrorKeywords() {
  return {"error", "ERROR", "fatal", "FATAL", "exception", "EXCEPTION", "panic", "PANIC"};
}

std::vector<std::string> DefaultLogPaths() {
  return {"/cmconfig.log", "/logstore/TspCore", "/RTPTraceError", "/Envoy", "/dumplog"};
}

CollectorConfig DefaultCollectorConfig() {
  CollectorConfig config;
  config.symptom.error_keywords = DefaultErrorKeywords();
  config.log_paths = DefaultLogPaths();
  return config;
}

EnvLookup ProcessEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

bool ParseDurationText(std::string_view text, std::chrono::milliseconds& out, std::string& error) {
  if (text.empty()) {
    error = "duration cannot be empty";
    return false;
  }

  std::size_t digits = 0;
  while (digits < text.size() && text[digits] >= '0' && text[digits] <= '9') {
    ++digits;
  }
  if (digits == 0U) {
    error = "duration '" + std::string(text) + "' must start with an integer";
    return false;
  }

  std::int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + digits, value);
  if (ec != std::errc() || ptr != text.data() + digits) {
    error = "duration '" + std::string(text) + "' is out of range";
    return false;
  }

  const std::string_view unit = text.substr(digits);
  std::int64_t scale = 0;
  if (unit == "ms") {
    scale = 1;
  } else if (unit == "s") {
    scale = 1'000;
  } else if (unit == "m") {
    scale = 60'000;
  } else if (unit == "h") {
    scale = 3'600'000;
  } else {
    error = "duration '" + std::string(text) + "' needs a unit of ms, s, m or h";
    return false;
  }

  if (value > std::numeric_limits<std::int64_t>::max() / scale) {
    error = "duration '" + std::string(text) + "' is out of range";
    return false;
  }
  out = std::chrono::milliseconds(value * scale);
  return true;
}

std::string FormatDurationText(std::chrono::milliseconds duration) {
  const std::int64_t millis = duration.count();
  if (millis != 0 && millis % 3'600'000 == 0) {
    return std::to_string(millis / 3'600'000) + "h";
  }
  if (millis != 0 && millis % 60'000 == 0) {
    return std::to_string(millis / 60'000) + "m";
  }
  if (millis % 1'000 == 0) {
    return std::to_string(millis / 1'000) + "s";
  }
  return std::to_string(millis) + "ms";
}

std::vector<fs::path> DefaultConfigSearchPaths(const EnvLookup& env) {
  std::vector<fs::path> paths = {
      fs::path("symptomops.json"),
      fs::path("configs") / "symptomops.json",
  };
  const std::optional<std::string> home = env ? env("HOME") : std::nullopt;
  if (home.has_value() && !home->empty()) {
    paths.push_back(fs::path(home.value()) / ".symptomops" / "symptomops.json");
  }
  paths.push_back(fs::path("/etc/symptomops/symptomops.json"));
  return paths;
}

std::optional<fs::path> ResolveConfigPath(const EnvLookup& env) {
  for (const auto& candidate : DefaultConfigSearchPaths(env)) {
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }
  return std::nullopt;
}

bool ApplyConfigJson(std::string_view json_text, CollectorConfig& config, ConfigReport& report,
                     std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "config root must be an object");
    return true;
  }

  CheckUnknownKeys(root, "", {"cluster", "symptom", "paths", "logging", "output", "sources"},
                   report);

  if (const JsonValue* cluster = ObjectSection(root, "cluster", report)) {
    CheckUnknownKeys(*cluster, "cluster", {"namespace", "kubeconfig_path", "request_timeout"},
                     report);
    ReadString(*cluster, "namespace", "cluster.namespace", config.cluster.namespace_name, report);
    ReadString(*cluster, "kubeconfig_path", "cluster.kubeconfig_path",
               config.cluster.kubeconfig_path, report);
    ReadDuration(*cluster, "request_timeout", "cluster.request_timeout",
                 config.cluster.request_timeout, report);
  }

  if (const JsonValue* symptom = ObjectSection(root, "symptom", report)) {
    CheckUnknownKeys(*symptom, "symptom",
                     {"error_keywords", "check_interval", "collection_timeout", "channel_capacity"},
                     report);
    ReadStringList(*symptom, "error_keywords", "symptom.error_keywords",
                   config.symptom.error_keywords, report);
    ReadDuration(*symptom, "check_interval", "symptom.check_interval",
                 config.symptom.check_interval, report);
    ReadDuration(*symptom, "collection_timeout", "symptom.collection_timeout",
                 config.symptom.collection_timeout, report);
    ReadCount(*symptom, "channel_capacity", "symptom.channel_capacity",
              config.symptom.channel_capacity, report);
  }

  if (const JsonValue* paths = ObjectSection(root, "paths", report)) {
    CheckUnknownKeys(*paths, "paths", {"log_paths"}, report);
    ReadStringList(*paths, "log_paths", "paths.log_paths", config.log_paths, report);
  }

  if (const JsonValue* logging = ObjectSection(root, "logging", report)) {
    CheckUnknownKeys(*logging, "logging", {"level"}, report);
    ReadString(*logging, "level", "logging.level", config.log_level, report);
  }

  if (const JsonValue* output = ObjectSection(root, "output", report)) {
    CheckUnknownKeys(*output, "output", {"dir"}, report);
    ReadString(*output, "dir", "output.dir", config.output_dir, report);
  }

  if (const JsonValue* sources = ObjectSection(root, "sources", report)) {
    CheckUnknownKeys(*sources, "sources", {"trace", "capture", "exerciser"}, report);
    ReadPodCommands(*sources, "trace", config.sources.trace, report);
    ReadPodCommands(*sources, "capture", config.sources.capture, report);
    const JsonValue* exerciser = sources->Find("exerciser");
    if (exerciser != nullptr) {
      if (!exerciser->IsObject()) {
        AddIssue(report, "sources.exerciser", "must be an object");
      } else {
        CheckUnknownKeys(*exerciser, "sources.exerciser", {"command"}, report);
        ReadString(*exerciser, "command", "sources.exerciser.command",
                   config.sources.exerciser_command, report);
      }
    }
  }

  return true;
}

bool LoadCollectorConfigFile(const fs::path& config_path, CollectorConfig& config,
                             ConfigReport& report, std::string& error) {
  std::ifstream in(config_path, std::ios::binary);
  if (!in) {
    error = "failed to open config file '" + config_path.string() + "'";
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (!in.good() && !in.eof()) {
    error = "failed while reading config file '" + config_path.string() + "'";
    return false;
  }

  std::string parse_error;
  if (!ApplyConfigJson(buffer.str(), config, report, parse_error)) {
    error = "invalid config file '" + config_path.string() + "': " + parse_error;
    return false;
  }
  config.loaded_from = config_path.string();
  return true;
}

void ApplyEnvironmentOverrides(const EnvLookup& env, CollectorConfig& config) {
  if (!env) {
    return;
  }
  const auto apply = [&env](const char* name, std::string& target) {
    const std::optional<std::string> value = env(name);
    if (value.has_value() && !value->empty()) {
      target = value.value();
    }
  };
  apply("SYMPTOMOPS_NAMESPACE", config.cluster.namespace_name);
  apply("SYMPTOMOPS_LOG_LEVEL", config.log_level);
  apply("SYMPTOMOPS_KUBECONFIG_PATH", config.cluster.kubeconfig_path);
  apply("SYMPTOMOPS_OUTPUT_DIR", config.output_dir);
}

void ValidateCollectorConfig(const CollectorConfig& config, ConfigReport& report) {
  if (config.cluster.namespace_name.empty()) {
    AddIssue(report, "cluster.namespace", "must not be empty");
  }
  if (config.cluster.request_timeout.count() <= 0) {
    AddIssue(report, "cluster.request_timeout", "must be greater than zero");
  }
  if (config.symptom.error_keywords.empty()) {
    AddIssue(report, "symptom.error_keywords", "must contain at least one keyword");
  }
  for (std::size_t i = 0; i < config.symptom.error_keywords.size(); ++i) {
    if (config.symptom.error_keywords[i].empty()) {
      AddIssue(report, "symptom.error_keywords[" + std::to_string(i) + "]",
               "must not be empty (an empty keyword matches every line)");
    }
  }
  if (config.symptom.check_interval.count() <= 0) {
    AddIssue(report, "symptom.check_interval", "must be greater than zero");
  }
  if (config.symptom.collection_timeout.count() <= 0) {
    AddIssue(report, "symptom.collection_timeout", "must be greater than zero");
  }
  if (config.symptom.channel_capacity == 0U) {
    AddIssue(report, "symptom.channel_capacity", "must be at least 1");
  }
  for (std::size_t i = 0; i < config.log_paths.size(); ++i) {
    if (config.log_paths[i].empty()) {
      AddIssue(report, "paths.log_paths[" + std::to_string(i) + "]", "must not be empty");
    }
  }
  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  std::string level_error;
  if (!core::logging::ParseLogLevel(config.log_level, level, level_error)) {
    AddIssue(report, "logging.level", level_error);
  }
  if (config.output_dir.empty()) {
    AddIssue(report, "output.dir", "must not be empty");
  }
  report.valid = report.issues.empty();
}

} // namespace symptomops::config
