#pragma once

#include "core/logging/logger.hpp"
#include "sources/evidence_source.hpp"

#include <string>

namespace symptomops::sources {

// Shell command templates for one per-pod evidence kind. Placeholders:
// `{namespace}`, `{pod}` (fragment), `{deployment}`, `{session_id}`.
// An empty template is a no-op.
struct PodCommandTemplates {
  std::string enable;
  std::string disable;
  std::string collect;
};

// Trace or packet-capture enablement modelled as per-target shell commands.
//
// Enable/Disable run their template once per target and keep going after a
// failing target so one broken pod does not hide the others. CollectArtifacts
// stores each target's `collect` output as `<bundle>/<kind>/<pod>.txt`.
class PodCommandSource final : public EvidenceSource {
public:
  PodCommandSource(session::TaskKind kind, PodCommandTemplates templates,
                   core::logging::Logger& logger);

  session::TaskKind Kind() const override {
    return kind_;
  }
  std::string Name() const override;

  bool Enable(const SourceContext& context, std::string& error) override;
  bool Disable(const SourceContext& context, std::string& error) override;
  bool CollectArtifacts(const SourceContext& context, const std::filesystem::path& bundle_dir,
                        std::vector<std::filesystem::path>& written,
                        std::string& error) override;

  bool IsConfigured() const;

private:
  bool RunForEachTarget(const SourceContext& context, const std::string& command_template,
                        const char* step, std::string& error);

  const session::TaskKind kind_;
  const PodCommandTemplates templates_;
  core::logging::Logger& logger_;
};

} // namespace symptomops::sources
