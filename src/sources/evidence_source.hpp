#pragma once

#include "session/collection_session.hpp"
#include "session/stop_signal.hpp"
#include "session/task_registry.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace symptomops::sources {

// One validated workload target: the operator-supplied fragment and the
// deployment it resolved to during preflight.
struct SourceTarget {
  std::string fragment;
  std::string deployment;
};

// Everything a source may look at. Built once after preflight passed.
struct SourceContext {
  const session::CollectionSession* session = nullptr;
  std::vector<SourceTarget> targets;
};

// Shared evidence-source contract used by session orchestration.
//
// The orchestrator runs each source on its own task thread as
// Enable -> Run -> Disable and calls CollectArtifacts once every task has
// stopped. A failing Enable is recorded but never aborts the session.
class EvidenceSource {
public:
  virtual ~EvidenceSource() = default;

  virtual session::TaskKind Kind() const = 0;
  virtual std::string Name() const = 0;

  virtual bool Enable(const SourceContext& context, std::string& error) = 0;

  // Blocks while the source is active. Passive sources just wait for stop;
  // the exerciser returns as soon as its test finishes.
  virtual bool Run(const SourceContext& /*context*/, const session::StopSignal& stop,
                   std::string& /*error*/) {
    stop.Wait();
    return true;
  }

  virtual bool Disable(const SourceContext& context, std::string& error) = 0;

  // Copies collected data under `bundle_dir`, appending every file written
  // to `written` (also on partial failure).
  virtual bool CollectArtifacts(const SourceContext& context,
                                const std::filesystem::path& bundle_dir,
                                std::vector<std::filesystem::path>& written,
                                std::string& error) = 0;

  // Exit status of the work done in Run, when the source has one.
  virtual std::optional<int> CompletionCode() const {
    return std::nullopt;
  }
};

} // namespace symptomops::sources
