#include "sources/pod_command_source.hpp"

#include "core/fs_utils.hpp"
#include "core/process/command_runner.hpp"
#include "sources/command_template.hpp"

#include <utility>

namespace symptomops::sources {

namespace {

TemplateVars MakeVars(const SourceContext& context, const SourceTarget& target) {
  return {
      {"namespace", context.session->namespace_name},
      {"pod", target.fragment},
      {"deployment", target.deployment},
      {"session_id", context.session->session_id},
  };
}

void AppendError(std::string& aggregate, const std::string& message) {
  if (!aggregate.empty()) {
    aggregate += "; ";
  }
  aggregate += message;
}

} // namespace

PodCommandSource::PodCommandSource(session::TaskKind kind, PodCommandTemplates templates,
                                   core::logging::Logger& logger)
    : kind_(kind), templates_(std::move(templates)), logger_(logger) {}

std::string PodCommandSource::Name() const {
  return session::ToString(kind_);
}

bool PodCommandSource::IsConfigured() const {
  return !templates_.enable.empty() || !templates_.disable.empty() ||
         !templates_.collect.empty();
}

bool PodCommandSource::Enable(const SourceContext& context, std::string& error) {
  return RunForEachTarget(context, templates_.enable, "enable", error);
}

bool PodCommandSource::Disable(const SourceContext& context, std::string& error) {
  return RunForEachTarget(context, templates_.disable, "disable", error);
}

bool PodCommandSource::RunForEachTarget(const SourceContext& context,
                                        const std::string& command_template, const char* step,
                                        std::string& error) {
  error.clear();
  if (command_template.empty()) {
    return true;
  }
  if (context.session == nullptr) {
    error = "source context has no session";
    return false;
  }

  bool all_ok = true;
  for (const auto& target : context.targets) {
    const std::string command = ExpandTemplate(command_template, MakeVars(context, target));
    logger_.Debug("running source command", {{"source", Name()},
                                             {"step", step},
                                             {"pod", target.fragment},
                                             {"command", command}});
    std::string output;
    int exit_code = -1;
    std::string run_error;
    if (!core::process::RunShellCommand(command, output, exit_code, run_error)) {
      all_ok = false;
      AppendError(error, target.fragment + ": " + run_error);
      continue;
    }
    if (exit_code != 0) {
      all_ok = false;
      AppendError(error, target.fragment + ": " + step + " command exited with code " +
                             std::to_string(exit_code));
    }
  }
  return all_ok;
}

bool PodCommandSource::CollectArtifacts(const SourceContext& context,
                                        const std::filesystem::path& bundle_dir,
                                        std::vector<std::filesystem::path>& written,
                                        std::string& error) {
  error.clear();
  if (templates_.collect.empty()) {
    return true;
  }
  if (context.session == nullptr) {
    error = "source context has no session";
    return false;
  }

  const std::filesystem::path kind_dir = bundle_dir / Name();
  bool all_ok = true;
  for (const auto& target : context.targets) {
    const std::string command = ExpandTemplate(templates_.collect, MakeVars(context, target));
    std::string output;
    int exit_code = -1;
    std::string run_error;
    if (!core::process::RunShellCommand(command, output, exit_code, run_error)) {
      all_ok = false;
      AppendError(error, target.fragment + ": " + run_error);
      continue;
    }

    const std::filesystem::path target_path =
        kind_dir / (core::SanitizePathForFileName(target.fragment) + ".txt");
    std::string write_error;
    if (!core::WriteTextFileAtomic(target_path, output, write_error)) {
      all_ok = false;
      AppendError(error, write_error);
      continue;
    }
    written.push_back(target_path);

    if (exit_code != 0) {
      all_ok = false;
      AppendError(error, target.fragment + ": collect command exited with code " +
                             std::to_string(exit_code));
    }
  }
  return all_ok;
}

} // namespace symptomops::sources
