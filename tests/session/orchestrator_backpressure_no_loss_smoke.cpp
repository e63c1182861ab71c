#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "cluster/snapshot_client.hpp"
#include "core/logging/logger.hpp"
#include "session/error_aggregator.hpp"
#include "session/session_orchestrator.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

using symptomops::tests::common::Fail;

class SlowSink final : public symptomops::session::ErrorEventSink {
public:
  void Consume(const symptomops::session::ErrorEvent& /*event*/,
               std::uint64_t sequence) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    if (sequence != last_sequence_ + 1U) {
      Fail("sequence numbers must be contiguous");
    }
    last_sequence_ = sequence;
  }

  std::uint64_t LastSequence() const {
    return last_sequence_;
  }

private:
  std::uint64_t last_sequence_ = 0;
};

class BurstExerciser final : public symptomops::tests::common::TimedExerciser {
public:
  BurstExerciser(fs::path target, int lines)
      : TimedExerciser(std::chrono::milliseconds(20)), target_(std::move(target)), lines_(lines) {}

  bool Run(const symptomops::sources::SourceContext& context,
           const symptomops::session::StopSignal& stop, std::string& error) override {
    std::vector<std::string> burst;
    for (int i = 0; i < lines_; ++i) {
      burst.push_back("ERROR burst line " + std::to_string(i));
    }
    symptomops::tests::common::AppendLines(target_, burst);
    return TimedExerciser::Run(context, stop, error);
  }

private:
  const fs::path target_;
  const int lines_;
};

// A consumer slower than the producers: senders must park, never drop.
void CheckAggregatorBlocksProducers() {
  SlowSink sink;
  symptomops::session::ErrorAggregator aggregator(2, {&sink});
  std::string error;
  if (!aggregator.Start(error)) {
    Fail("aggregator start failed: " + error);
  }
  constexpr int kEvents = 60;
  std::thread producer([&aggregator] {
    symptomops::session::ChannelWriter writer = aggregator.MakeWriter("burst");
    for (int i = 0; i < kEvents; ++i) {
      if (!writer.Send("ERROR " + std::to_string(i))) {
        Fail("send rejected while aggregator open");
      }
    }
  });
  producer.join();
  (void)aggregator.Close();

  if (aggregator.BlockedSends() == 0U) {
    Fail("producer should have blocked on the full channel");
  }
  if (aggregator.HighWaterMark() > 2U) {
    Fail("queue grew past its capacity");
  }
  if (aggregator.Consumed() != static_cast<std::uint64_t>(kEvents) ||
      sink.LastSequence() != static_cast<std::uint64_t>(kEvents)) {
    Fail("events were lost under backpressure");
  }
}

} // namespace

int main() {
  using symptomops::tests::common::CreateUniqueTempDir;
  using symptomops::tests::common::RemovePathBestEffort;

  CheckAggregatorBlocksProducers();

  const fs::path temp_root = CreateUniqueTempDir("symptomops-backpressure");
  const fs::path watched = temp_root / "TspCore.log";
  symptomops::tests::common::TouchFile(watched);

  symptomops::cluster::SnapshotClusterClient client;
  symptomops::tests::common::SeedReadyCluster(client, {"uecm-main"});
  std::ostringstream log_output;
  symptomops::core::logging::Logger logger(symptomops::core::logging::LogLevel::kWarn,
                                           log_output);

  constexpr int kBurst = 500;
  const auto session = symptomops::tests::common::MakeTestSession(
      temp_root / "out", {"uecm"}, {watched.string()}, std::chrono::seconds(20),
      std::chrono::milliseconds(5), 1);
  symptomops::session::SessionOrchestrator orchestrator(session, client, logger);
  orchestrator.SetExerciser(std::make_unique<BurstExerciser>(watched, kBurst));

  symptomops::session::SessionReport report;
  std::string error;
  if (!orchestrator.Run(report, error)) {
    Fail("run failed: " + error);
  }

  if (report.total_events != static_cast<std::uint64_t>(kBurst)) {
    Fail("expected every burst line, got " + std::to_string(report.total_events));
  }
  if (report.channel.capacity != 1U || report.channel.high_water_mark > 1U) {
    Fail("channel must honour capacity 1");
  }
  if (report.channel.sends_after_close != 0U || report.channel.close_calls != 1U) {
    Fail("unexpected channel close accounting");
  }
  for (std::size_t i = 0; i < report.events.size(); ++i) {
    if (report.events[i].message != "ERROR burst line " + std::to_string(i)) {
      Fail("events from one source must keep file order");
    }
  }

  RemovePathBestEffort(temp_root);
  return 0;
}
