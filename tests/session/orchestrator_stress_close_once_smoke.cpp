#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "cluster/snapshot_client.hpp"
#include "core/logging/logger.hpp"
#include "session/session_orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

using symptomops::tests::common::Fail;

std::uint64_t CountErrorDetectedLines(const fs::path& events_path) {
  std::ifstream in(events_path, std::ios::binary);
  if (!in) {
    Fail("failed to open " + events_path.string());
  }
  std::uint64_t count = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.find("\"type\":\"error_detected\"") != std::string::npos) {
      ++count;
    }
  }
  return count;
}

} // namespace

int main() {
  using symptomops::session::SessionState;
  using symptomops::session::TaskState;
  using symptomops::tests::common::CreateUniqueTempDir;
  using symptomops::tests::common::RemovePathBestEffort;

  const fs::path temp_root = CreateUniqueTempDir("symptomops-stress-close-once");
  symptomops::cluster::SnapshotClusterClient client;
  symptomops::tests::common::SeedReadyCluster(client, {"uecm-main", "tsp-core"});
  std::ostringstream log_output;
  symptomops::core::logging::Logger logger(symptomops::core::logging::LogLevel::kError,
                                           log_output);

  std::mt19937 rng(20240611U);
  std::uniform_int_distribution<int> watcher_count(1, 6);
  std::uniform_int_distribution<int> source_count(0, 3);
  std::uniform_int_distribution<int> capacity(1, 8);
  std::uniform_int_distribution<int> exerciser_ms(0, 80);
  std::uniform_int_distribution<int> timeout_ms(20, 120);
  std::bernoulli_distribution with_exerciser(0.7);

  constexpr int kIterations = 25;
  for (int iteration = 0; iteration < kIterations; ++iteration) {
    const fs::path iteration_dir = temp_root / ("iter-" + std::to_string(iteration));
    fs::create_directories(iteration_dir);

    std::vector<std::string> paths;
    const int watchers = watcher_count(rng);
    for (int w = 0; w < watchers; ++w) {
      const fs::path path = iteration_dir / ("watched-" + std::to_string(w) + ".log");
      symptomops::tests::common::TouchFile(path);
      paths.push_back(path.string());
    }

    const auto session = symptomops::tests::common::MakeTestSession(
        iteration_dir / "out", {"uecm", "tsp"}, paths,
        std::chrono::milliseconds(timeout_ms(rng)), std::chrono::milliseconds(2),
        static_cast<std::size_t>(capacity(rng)));
    symptomops::session::SessionOrchestrator orchestrator(session, client, logger);
    const int sources = source_count(rng);
    for (int s = 0; s < sources; ++s) {
      orchestrator.AddSource(std::make_unique<symptomops::tests::common::FakeSource>(
          s % 2 == 0 ? symptomops::session::TaskKind::kTrace
                     : symptomops::session::TaskKind::kCapture,
          "source-" + std::to_string(s), s != 1));
    }
    if (with_exerciser(rng)) {
      orchestrator.SetExerciser(std::make_unique<symptomops::tests::common::TimedExerciser>(
          std::chrono::milliseconds(exerciser_ms(rng))));
    }

    // Writers keep appending while the session drains and closes.
    std::atomic<bool> keep_writing{true};
    std::vector<std::thread> writers;
    for (const auto& path : paths) {
      writers.emplace_back([&keep_writing, path] {
        int n = 0;
        while (keep_writing.load()) {
          symptomops::tests::common::AppendLines(
              path, {"ERROR burst " + std::to_string(n), "info filler " + std::to_string(n)});
          ++n;
          std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
      });
    }

    symptomops::session::SessionReport report;
    std::string error;
    const bool ok = orchestrator.Run(report, error);
    keep_writing.store(false);
    for (auto& writer : writers) {
      writer.join();
    }
    if (!ok) {
      Fail("run failed: " + error);
    }

    if (report.final_state != SessionState::kClosed) {
      Fail("session did not close");
    }
    if (report.channel.close_calls != 1U) {
      Fail("channel closed " + std::to_string(report.channel.close_calls) + " times");
    }
    if (!report.channel.closed_after_all_tasks_stopped) {
      Fail("channel closed before every task stopped");
    }
    if (report.channel.sends_after_close != 0U) {
      Fail("a producer wrote after close");
    }
    if (report.channel.high_water_mark > report.channel.capacity) {
      Fail("channel depth exceeded its capacity");
    }
    for (const auto& task : report.tasks) {
      if (task.state != TaskState::kStopped) {
        Fail("task left running: " + task.name);
      }
    }

    std::uint64_t by_source_total = 0;
    for (const auto& [source, count] : report.events_by_source) {
      by_source_total += count;
    }
    if (by_source_total != report.total_events || report.events.size() != report.total_events) {
      Fail("per-source counts do not add up to the total");
    }
    if (report.events_by_source.size() != paths.size()) {
      Fail("every monitored path must be listed in the per-source counts");
    }
    if (CountErrorDetectedLines(session.bundle_dir / "events.jsonl") != report.total_events) {
      Fail("timeline and report disagree on detected events");
    }
  }

  RemovePathBestEffort(temp_root);
  return 0;
}
