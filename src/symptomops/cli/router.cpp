#include "symptomops/cli/router.hpp"

#include "cluster/kubectl_client.hpp"
#include "cluster/snapshot_client.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/time_utils.hpp"
#include "preflight/validator.hpp"
#include "session/collection_session.hpp"
#include "session/session_orchestrator.hpp"
#include "sources/command_exerciser.hpp"
#include "sources/pod_command_source.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace symptomops::cli {

namespace {

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitValidationFailed =
    core::errors::ToInt(core::errors::ExitCode::kValidationFailed);
constexpr int kExitClusterUnavailable =
    core::errors::ToInt(core::errors::ExitCode::kClusterUnavailable);

std::atomic<bool> g_interrupt_requested{false};

void HandleInterruptSignal(int /*signal_number*/) {
  g_interrupt_requested.store(true);
}

// Routes SIGINT/SIGTERM into the interrupt flag for the lifetime of one
// `collect` run and restores the previous handlers afterwards.
class ScopedInterruptHandlers {
public:
  ScopedInterruptHandlers() {
    g_interrupt_requested.store(false);
    previous_int_ = std::signal(SIGINT, HandleInterruptSignal);
    previous_term_ = std::signal(SIGTERM, HandleInterruptSignal);
  }

  ~ScopedInterruptHandlers() {
    if (previous_int_ != SIG_ERR) {
      std::signal(SIGINT, previous_int_);
    }
    if (previous_term_ != SIG_ERR) {
      std::signal(SIGTERM, previous_term_);
    }
  }

  ScopedInterruptHandlers(const ScopedInterruptHandlers&) = delete;
  ScopedInterruptHandlers& operator=(const ScopedInterruptHandlers&) = delete;

private:
  using Handler = void (*)(int);
  Handler previous_int_ = SIG_ERR;
  Handler previous_term_ = SIG_ERR;
};

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  symptomops collect -p \"<pod-fragment> [pod-fragment...]\" [-n <namespace>] "
         "[-c <config.json>] [--out <dir>] [--timeout <duration>] "
         "[--log-level <debug|info|warn|error>] [--cluster-snapshot <file.json>]\n"
      << "  symptomops validate -p \"<pod-fragment> [pod-fragment...]\" [-n <namespace>] "
         "[-c <config.json>] [--cluster-snapshot <file.json>]\n"
      << "  symptomops list-deployments [-n <namespace>] [-c <config.json>] "
         "[--cluster-snapshot <file.json>]\n"
      << "  symptomops version\n";
}

enum class FragmentRequirement {
  kRequired,
  kRejected,
};

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

// Parse shared subcommand flags. Unknown flags and positional arguments are
// usage errors so a typo never silently falls back to a default.
bool ParseCollectOptions(const std::vector<std::string_view>& args,
                         FragmentRequirement fragments, CollectOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;

    if (token == "-p" || token == "--pods") {
      if (fragments == FragmentRequirement::kRejected) {
        error = "unknown option: " + std::string(token);
        return false;
      }
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      for (auto& fragment : SplitPodFragments(value)) {
        options.pod_fragments.push_back(std::move(fragment));
      }
      continue;
    }
    if (token == "-n" || token == "--namespace") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = "namespace cannot be empty";
        return false;
      }
      options.namespace_name = value;
      continue;
    }
    if (token == "-c" || token == "--config") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.config_path = fs::path(value);
      continue;
    }
    if (token == "--cluster-snapshot") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.cluster_snapshot_path = fs::path(value);
      continue;
    }
    if (token == "--out") {
      if (fragments == FragmentRequirement::kRejected) {
        error = "unknown option: " + std::string(token);
        return false;
      }
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (token == "--timeout") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      std::chrono::milliseconds parsed{0};
      if (!config::ParseDurationText(value, parsed, error)) {
        error = "invalid --timeout: " + error;
        return false;
      }
      if (parsed.count() <= 0) {
        error = "--timeout must be greater than zero";
        return false;
      }
      options.timeout = parsed;
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    error = "unexpected argument: " + std::string(token);
    return false;
  }

  if (fragments == FragmentRequirement::kRequired && options.pod_fragments.empty()) {
    error = "at least one pod fragment is required (-p \"<fragment> [fragment...]\")";
    return false;
  }
  return true;
}

void PrintConfigIssues(const config::ConfigReport& report) {
  std::cerr << "invalid config:\n";
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Resolve config and print any problem. Returns kExitSuccess when usable.
int LoadConfigOrReport(const CollectOptions& options, config::CollectorConfig& config) {
  config::ConfigReport report;
  std::string error;
  if (!ResolveEffectiveConfig(options, config::ProcessEnvironment(), config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (!report.valid) {
    PrintConfigIssues(report);
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

core::logging::LogLevel EffectiveLogLevel(const config::CollectorConfig& config) {
  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  std::string ignored;
  // Already validated by ValidateCollectorConfig.
  (void)core::logging::ParseLogLevel(config.log_level, level, ignored);
  return level;
}

// Offline snapshot when requested, otherwise kubectl against the configured
// cluster.
bool BuildClusterClient(const CollectOptions& options, const config::CollectorConfig& config,
                        std::unique_ptr<cluster::ClusterClient>& client, std::string& error) {
  if (options.cluster_snapshot_path.has_value()) {
    auto snapshot = std::make_unique<cluster::SnapshotClusterClient>();
    if (!cluster::LoadClusterSnapshotFile(options.cluster_snapshot_path.value(), *snapshot,
                                          error)) {
      return false;
    }
    client = std::move(snapshot);
    return true;
  }

  client = std::make_unique<cluster::KubectlClusterClient>(cluster::KubectlOptions{
      .kubectl_binary = "kubectl",
      .kubeconfig_path = config.cluster.kubeconfig_path,
      .request_timeout = config.cluster.request_timeout,
  });
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  std::cout << "symptomops 0.1.0\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  CollectOptions options;
  std::string error;
  if (!ParseCollectOptions(args, FragmentRequirement::kRequired, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::CollectorConfig config;
  if (const int exit_code = LoadConfigOrReport(options, config); exit_code != kExitSuccess) {
    return exit_code;
  }

  std::unique_ptr<cluster::ClusterClient> client;
  if (!BuildClusterClient(options, config, client, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  preflight::PreflightReport report;
  if (!preflight::ValidatePreflight(*client, config.cluster.namespace_name,
                                    options.pod_fragments, report, error)) {
    std::cerr << "validation failed: " << error << '\n';
    if (!report.candidate_names.empty()) {
      std::cerr << "  candidates:";
      for (const auto& name : report.candidate_names) {
        std::cerr << ' ' << name;
      }
      std::cerr << '\n';
    }
    return kExitValidationFailed;
  }

  std::cout << "valid: namespace " << report.namespace_name << '\n';
  for (const auto& readiness : report.deployments) {
    std::cout << "  " << readiness.fragment << " -> " << readiness.deployment_name << " ("
              << readiness.ready_replicas << "/" << readiness.desired_replicas << " ready)\n";
  }
  return kExitSuccess;
}

int CommandListDeployments(const std::vector<std::string_view>& args) {
  CollectOptions options;
  std::string error;
  if (!ParseCollectOptions(args, FragmentRequirement::kRejected, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::CollectorConfig config;
  if (const int exit_code = LoadConfigOrReport(options, config); exit_code != kExitSuccess) {
    return exit_code;
  }

  std::unique_ptr<cluster::ClusterClient> client;
  if (!BuildClusterClient(options, config, client, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::vector<cluster::Deployment> deployments;
  if (!client->ListDeployments(config.cluster.namespace_name, deployments, error)) {
    std::cerr << "error: failed to list deployments in namespace '"
              << config.cluster.namespace_name << "': " << error << '\n';
    return kExitClusterUnavailable;
  }

  std::size_t name_width = std::string_view("NAME").size();
  for (const auto& deployment : deployments) {
    name_width = std::max(name_width, deployment.name.size());
  }

  const auto now = std::chrono::system_clock::now();
  std::cout << std::left << std::setw(static_cast<int>(name_width + 3)) << "NAME"
            << std::setw(10) << "READY" << std::setw(8) << "AGE"
            << "IMAGE\n";
  for (const auto& deployment : deployments) {
    std::ostringstream ready;
    ready << deployment.ready_replicas << "/" << deployment.desired_replicas;
    std::cout << std::left << std::setw(static_cast<int>(name_width + 3)) << deployment.name
              << std::setw(10) << ready.str() << std::setw(8)
              << core::FormatAge(deployment.created_at, now)
              << (deployment.image.empty() ? "<none>" : deployment.image) << '\n';
  }
  if (deployments.empty()) {
    std::cout << "no deployments in namespace " << config.cluster.namespace_name << '\n';
  }
  return kExitSuccess;
}

int CommandCollect(const std::vector<std::string_view>& args) {
  CollectOptions options;
  std::string error;
  if (!ParseCollectOptions(args, FragmentRequirement::kRequired, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::CollectorConfig config;
  if (const int exit_code = LoadConfigOrReport(options, config); exit_code != kExitSuccess) {
    return exit_code;
  }

  core::logging::Logger logger(EffectiveLogLevel(config));
  if (!config.loaded_from.empty()) {
    logger.Debug("config loaded", {{"path", config.loaded_from}});
  }

  std::unique_ptr<cluster::ClusterClient> client;
  if (!BuildClusterClient(options, config, client, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  session::CollectionSession collection;
  if (!session::MakeCollectionSession(
          {
              .namespace_name = config.cluster.namespace_name,
              .pod_fragments = options.pod_fragments,
              .timeout = config.symptom.collection_timeout,
              .poll_interval = config.symptom.check_interval,
              .keywords = config.symptom.error_keywords,
              .monitored_paths = config.log_paths,
              .channel_capacity = config.symptom.channel_capacity,
              .output_root = fs::path(config.output_dir),
          },
          std::chrono::system_clock::now(), collection, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  session::SessionOrchestrator orchestrator(collection, *client, logger);
  auto trace = std::make_unique<sources::PodCommandSource>(
      session::TaskKind::kTrace,
      sources::PodCommandTemplates{.enable = config.sources.trace.enable,
                                   .disable = config.sources.trace.disable,
                                   .collect = config.sources.trace.collect},
      logger);
  if (trace->IsConfigured()) {
    orchestrator.AddSource(std::move(trace));
  }
  auto capture = std::make_unique<sources::PodCommandSource>(
      session::TaskKind::kCapture,
      sources::PodCommandTemplates{.enable = config.sources.capture.enable,
                                   .disable = config.sources.capture.disable,
                                   .collect = config.sources.capture.collect},
      logger);
  if (capture->IsConfigured()) {
    orchestrator.AddSource(std::move(capture));
  }
  // Without an exerciser the session collects until the timeout or an interrupt.
  if (!config.sources.exerciser_command.empty()) {
    orchestrator.SetExerciser(
        std::make_unique<sources::CommandExerciser>(config.sources.exerciser_command, logger));
  }

  ScopedInterruptHandlers interrupt_handlers;
  orchestrator.SetInterruptFlag(&g_interrupt_requested);

  session::SessionReport report;
  if (!orchestrator.Run(report, error)) {
    if (report.final_state == session::SessionState::kValidationFailed) {
      std::cerr << "validation failed: " << error << '\n';
      return kExitValidationFailed;
    }
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "session_id: " << report.session_id << '\n';
  std::cout << "bundle: " << report.bundle_dir.string() << '\n';
  std::cout << "state: " << session::ToString(report.final_state) << '\n';
  std::cout << "end_reason: " << session::ToString(report.end_reason) << '\n';
  std::cout << "duration: " << core::FormatDuration(report.duration) << '\n';
  std::cout << "tasks: " << report.TasksStarted() << '\n';
  std::cout << "error_events: " << report.total_events << '\n';
  for (const auto& [source, count] : report.events_by_source) {
    std::cout << "  " << source << ": " << count << '\n';
  }
  std::cout << "warnings: " << report.issues.size() << '\n';
  for (const auto& issue : report.issues) {
    std::cerr << "warning: " << session::ToString(issue.kind) << " [" << issue.source
              << "]: " << issue.message << '\n';
  }
  return kExitSuccess;
}

} // namespace

std::vector<std::string> SplitPodFragments(const std::string& raw) {
  std::vector<std::string> fragments;
  std::istringstream in(raw);
  std::string token;
  while (in >> token) {
    fragments.push_back(token);
  }
  return fragments;
}

bool ResolveEffectiveConfig(const CollectOptions& options, const config::EnvLookup& env,
                            config::CollectorConfig& config, config::ConfigReport& report,
                            std::string& error) {
  config = config::DefaultCollectorConfig();
  report = config::ConfigReport{};
  error.clear();

  std::optional<fs::path> config_path = options.config_path;
  if (!config_path.has_value()) {
    config_path = config::ResolveConfigPath(env);
  }
  if (config_path.has_value() &&
      !config::LoadCollectorConfigFile(config_path.value(), config, report, error)) {
    return false;
  }

  config::ApplyEnvironmentOverrides(env, config);

  if (options.namespace_name.has_value()) {
    config.cluster.namespace_name = options.namespace_name.value();
  }
  if (options.output_dir.has_value()) {
    config.output_dir = options.output_dir->string();
  }
  if (options.timeout.has_value()) {
    config.symptom.collection_timeout = options.timeout.value();
  }
  if (options.log_level.has_value()) {
    config.log_level = core::logging::ToString(options.log_level.value());
  }

  config::ValidateCollectorConfig(config, report);
  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "collect") {
    return CommandCollect(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "list-deployments") {
    return CommandListDeployments(args);
  }
  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace symptomops::cli
