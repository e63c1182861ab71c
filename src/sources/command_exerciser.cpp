#include "sources/command_exerciser.hpp"

#include "core/process/command_runner.hpp"
#include "sources/command_template.hpp"

#include <system_error>
#include <utility>

namespace symptomops::sources {

CommandExerciser::CommandExerciser(std::string command_template, core::logging::Logger& logger,
                                   std::chrono::milliseconds stop_check_interval)
    : command_template_(std::move(command_template)), logger_(logger),
      stop_check_interval_(stop_check_interval) {}

std::filesystem::path CommandExerciser::OutputPath(const std::filesystem::path& bundle_dir) {
  return bundle_dir / "exerciser" / "output.log";
}

bool CommandExerciser::Enable(const SourceContext& /*context*/, std::string& error) {
  error.clear();
  if (command_template_.empty()) {
    logger_.Warn("no exerciser command configured; exerciser completes immediately");
  }
  return true;
}

bool CommandExerciser::Run(const SourceContext& context, const session::StopSignal& stop,
                           std::string& error) {
  error.clear();
  if (command_template_.empty()) {
    return true;
  }
  if (context.session == nullptr) {
    error = "source context has no session";
    return false;
  }

  std::string pods;
  for (const auto& fragment : context.session->pod_fragments) {
    if (!pods.empty()) {
      pods += ' ';
    }
    pods += fragment;
  }
  const std::string command = ExpandTemplate(command_template_,
                                             {
                                                 {"namespace", context.session->namespace_name},
                                                 {"pods", pods},
                                                 {"session_id", context.session->session_id},
                                             });

  logger_.Info("exerciser started", {{"command", command}});
  core::process::StreamedCommandOptions options;
  options.output_path = OutputPath(context.session->bundle_dir);
  options.poll_interval = stop_check_interval_;
  options.should_stop = [&stop] { return stop.IsRequested(); };

  core::process::StreamedCommandResult result;
  if (!core::process::RunShellCommandUntilStopped(command, options, result, error)) {
    return false;
  }

  ran_command_ = true;
  stopped_ = result.stopped;
  exit_code_ = result.exit_code;
  const std::string exit_text = std::to_string(result.exit_code);
  const std::string bytes_text = std::to_string(result.bytes_written);
  if (result.stopped) {
    logger_.Info("exerciser stopped before completion", {{"exit_code", exit_text}});
  } else if (result.exit_code != 0) {
    logger_.Warn("exerciser exited with non-zero status",
                 {{"exit_code", exit_text}, {"output_bytes", bytes_text}});
  } else {
    logger_.Info("exerciser completed", {{"exit_code", exit_text}, {"output_bytes", bytes_text}});
  }
  return true;
}

bool CommandExerciser::Disable(const SourceContext& /*context*/, std::string& error) {
  error.clear();
  return true;
}

bool CommandExerciser::CollectArtifacts(const SourceContext& /*context*/,
                                        const std::filesystem::path& bundle_dir,
                                        std::vector<std::filesystem::path>& written,
                                        std::string& error) {
  error.clear();
  const std::filesystem::path output = OutputPath(bundle_dir);
  std::error_code ec;
  if (std::filesystem::is_regular_file(output, ec)) {
    written.push_back(output);
  } else if (ran_command_.load()) {
    error = "exerciser output '" + output.string() + "' is missing";
    return false;
  }
  return true;
}

std::optional<int> CommandExerciser::CompletionCode() const {
  if (!ran_command_.load()) {
    return std::nullopt;
  }
  return exit_code_.load();
}

} // namespace symptomops::sources
