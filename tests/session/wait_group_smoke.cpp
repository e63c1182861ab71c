#include "../common/assertions.hpp"
#include "session/stop_signal.hpp"
#include "session/wait_group.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using symptomops::tests::common::Fail;

int main() {
  symptomops::session::WaitGroup group;
  symptomops::session::StopSignal stop;
  std::atomic<int> finished{0};

  constexpr int kWorkers = 8;
  std::vector<std::thread> workers;
  for (int i = 0; i < kWorkers; ++i) {
    group.Add();
    workers.emplace_back([&] {
      stop.Wait();
      ++finished;
      std::string error;
      if (!group.Done(error)) {
        Fail("Done failed: " + error);
      }
    });
  }

  if (group.Pending() != static_cast<std::size_t>(kWorkers)) {
    Fail("every Add should be pending before stop");
  }
  if (group.WaitFor(std::chrono::milliseconds(20))) {
    Fail("wait must not finish while workers are blocked on stop");
  }

  if (!stop.Request()) {
    Fail("first stop request should flip the signal");
  }
  if (stop.Request()) {
    Fail("repeated stop request should report no change");
  }
  group.Wait();
  if (finished.load() != kWorkers) {
    Fail("wait returned before every worker finished");
  }
  for (auto& worker : workers) {
    worker.join();
  }
  if (group.Pending() != 0U || group.TotalAdded() != static_cast<std::size_t>(kWorkers)) {
    Fail("unexpected wait group counters");
  }

  std::string error;
  if (group.Done(error) || error.empty()) {
    Fail("unbalanced Done must be reported");
  }

  // Stop signal: WaitFor returns true immediately once requested.
  if (!stop.WaitFor(std::chrono::milliseconds(1'000))) {
    Fail("requested stop should satisfy WaitFor");
  }

  symptomops::session::CompletionSignal completion;
  std::thread completer([&completion] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    completion.Complete(3);
    completion.Complete(9);
  });
  if (!completion.WaitFor(std::chrono::milliseconds(2'000))) {
    Fail("completion signal not observed");
  }
  completer.join();
  if (!completion.IsComplete() || completion.ExitCode() != 3) {
    Fail("first completion should win");
  }
  return 0;
}
