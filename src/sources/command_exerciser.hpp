#pragma once

#include "core/logging/logger.hpp"
#include "sources/evidence_source.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace symptomops::sources {

// Runs the workload-exercising test command. Placeholders: `{namespace}`,
// `{pods}` (space-separated fragments), `{session_id}`.
//
// Run() returns when the command exits (the session's completion trigger) or
// when stop is requested, in which case the command's process group is
// terminated. Output lands in `<bundle>/exerciser/output.log`. Without a
// command the exerciser completes immediately.
class CommandExerciser final : public EvidenceSource {
public:
  CommandExerciser(std::string command_template, core::logging::Logger& logger,
                   std::chrono::milliseconds stop_check_interval = std::chrono::milliseconds(100));

  session::TaskKind Kind() const override {
    return session::TaskKind::kExerciser;
  }
  std::string Name() const override {
    return "exerciser";
  }

  bool Enable(const SourceContext& context, std::string& error) override;
  bool Run(const SourceContext& context, const session::StopSignal& stop,
           std::string& error) override;
  bool Disable(const SourceContext& context, std::string& error) override;
  bool CollectArtifacts(const SourceContext& context, const std::filesystem::path& bundle_dir,
                        std::vector<std::filesystem::path>& written,
                        std::string& error) override;

  std::optional<int> CompletionCode() const override;

  bool WasStopped() const {
    return stopped_.load();
  }

  static std::filesystem::path OutputPath(const std::filesystem::path& bundle_dir);

private:
  const std::string command_template_;
  core::logging::Logger& logger_;
  const std::chrono::milliseconds stop_check_interval_;
  std::atomic<bool> ran_command_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<int> exit_code_{0};
};

} // namespace symptomops::sources
