#include "../common/assertions.hpp"
#include "../common/session_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/logging/logger.hpp"
#include "session/bounded_channel.hpp"
#include "session/error_aggregator.hpp"
#include "session/stop_signal.hpp"
#include "watch/log_watcher.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

using symptomops::tests::common::Fail;

template <typename Predicate>
bool WaitUntil(Predicate predicate) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return predicate();
}

std::vector<std::string> Drain(symptomops::session::BoundedChannel<symptomops::session::ErrorEvent>&
                                   channel) {
  std::vector<std::string> messages;
  (void)channel.Close();
  while (true) {
    std::optional<symptomops::session::ErrorEvent> event = channel.Receive();
    if (!event.has_value()) {
      return messages;
    }
    messages.push_back(event->message);
  }
}

void AppendRaw(const fs::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::app);
  out << text;
  out.flush();
}

} // namespace

int main() {
  using symptomops::tests::common::AssertContains;
  using symptomops::tests::common::CreateUniqueTempDir;
  using symptomops::tests::common::ReadFileToString;
  using symptomops::tests::common::RemovePathBestEffort;

  const fs::path temp_root = CreateUniqueTempDir("symptomops-log-watcher");
  const fs::path log_path = temp_root / "TspCore.log";
  symptomops::tests::common::AppendLines(log_path, {"ERROR before the session"});

  std::ostringstream log_output;
  symptomops::core::logging::Logger logger(symptomops::core::logging::LogLevel::kDebug,
                                           log_output);

  // File growth, partial lines, CRLF and truncation.
  {
    symptomops::session::BoundedChannel<symptomops::session::ErrorEvent> channel(64);
    symptomops::watch::LogWatcher watcher(
        log_path.string(), symptomops::watch::KeywordMatcher({"ERROR"}),
        std::chrono::milliseconds(5),
        symptomops::session::ChannelWriter(channel, log_path.string()), logger);
    symptomops::session::StopSignal stop;

    bool run_ok = false;
    std::string run_error;
    std::thread runner([&] { run_ok = watcher.Run(stop, run_error); });

    AppendRaw(log_path, "ERROR first\r\n");
    AppendRaw(log_path, "no match here\nERROR sec");
    if (!WaitUntil([&watcher] { return watcher.LinesScanned() >= 2U; })) {
      Fail("watcher did not pick up appended lines");
    }
    if (watcher.MatchedCount() != 1U) {
      Fail("an unterminated line must wait for its newline");
    }
    AppendRaw(log_path, "ond\n");
    if (!WaitUntil([&watcher] { return watcher.MatchedCount() >= 2U; })) {
      Fail("completed partial line was not matched");
    }

    // Rotation by truncation: reread from the start of the new content.
    {
      std::ofstream truncate(log_path, std::ios::binary | std::ios::trunc);
    }
    if (!WaitUntil([&watcher] { return watcher.TruncationCount() >= 1U; })) {
      Fail("truncation was not detected");
    }
    AppendRaw(log_path, "ERROR after rotate\nERROR unterminated tail");

    (void)stop.Request();
    runner.join();
    if (!run_ok) {
      Fail("watcher run failed: " + run_error);
    }
    std::string second_error;
    if (watcher.Run(stop, second_error)) {
      Fail("watcher must be single-use");
    }

    const std::vector<std::string> messages = Drain(channel);
    const std::vector<std::string> expected = {"ERROR first", "ERROR second", "ERROR after rotate",
                                               "ERROR unterminated tail"};
    if (messages != expected) {
      std::string joined;
      for (const auto& message : messages) {
        joined += "[" + message + "]";
      }
      Fail("unexpected watcher output: " + joined);
    }
    if (watcher.WatchErrorCount() != 0U) {
      Fail("no watch error expected for a present file");
    }

    fs::path slice;
    std::string error;
    if (!watcher.ExportSessionSlice(temp_root / "watched", slice, error)) {
      Fail("slice export failed: " + error);
    }
    const std::string slice_text = ReadFileToString(slice);
    AssertContains(slice_text, "ERROR after rotate");
  }

  // A path that appears mid-session is read from its first byte; the
  // unavailable period is reported once.
  {
    const fs::path late_path = temp_root / "late" / "RTPTraceError.log";
    symptomops::session::BoundedChannel<symptomops::session::ErrorEvent> channel(8);
    symptomops::watch::LogWatcher watcher(
        late_path.string(), symptomops::watch::KeywordMatcher({"ERROR"}),
        std::chrono::milliseconds(5),
        symptomops::session::ChannelWriter(channel, late_path.string()), logger);
    symptomops::session::StopSignal stop;
    std::string run_error;
    std::thread runner([&] { (void)watcher.Run(stop, run_error); });

    if (!WaitUntil([&watcher] { return watcher.WatchErrorCount() >= 1U; })) {
      Fail("missing path should be reported");
    }
    fs::create_directories(late_path.parent_path());
    symptomops::tests::common::AppendLines(late_path, {"ERROR from new file"});
    if (!WaitUntil([&watcher] { return watcher.MatchedCount() >= 1U; })) {
      Fail("late file content not picked up");
    }
    (void)stop.Request();
    runner.join();

    if (watcher.WatchErrorCount() != 1U) {
      Fail("one unavailable period expected");
    }
    const std::vector<std::string> messages = Drain(channel);
    if (messages.size() != 1U || messages.front() != "ERROR from new file") {
      Fail("unexpected output for late file");
    }
  }

  // A closed channel stops the watcher instead of failing writes forever.
  {
    const fs::path noisy = temp_root / "noisy.log";
    symptomops::tests::common::TouchFile(noisy);
    symptomops::session::BoundedChannel<symptomops::session::ErrorEvent> channel(4);
    (void)channel.Close();
    symptomops::watch::LogWatcher watcher(
        noisy.string(), symptomops::watch::KeywordMatcher({"ERROR"}),
        std::chrono::milliseconds(5), symptomops::session::ChannelWriter(channel, noisy.string()),
        logger);
    symptomops::tests::common::AppendLines(noisy, {"ERROR one", "ERROR two"});
    symptomops::session::StopSignal stop;
    std::string run_error;
    std::thread runner([&] { (void)watcher.Run(stop, run_error); });
    if (!WaitUntil([&channel] { return channel.SendsAfterClose() >= 1U; })) {
      Fail("watcher never tried the closed channel");
    }
    (void)stop.Request();
    runner.join();
    if (channel.SendsAfterClose() != 1U || watcher.MatchedCount() != 0U) {
      Fail("watcher should stop at the first rejected send");
    }
  }

  // A large file without newlines is read in bounded pieces and the watcher
  // keeps running until stopped.
  {
    const fs::path blob = temp_root / "blob" / "dumplog.bin";
    symptomops::session::BoundedChannel<symptomops::session::ErrorEvent> channel(64);
    symptomops::watch::LogWatcher watcher(
        blob.string(), symptomops::watch::KeywordMatcher({"ERROR"}),
        std::chrono::milliseconds(5), symptomops::session::ChannelWriter(channel, blob.string()),
        logger);

    // 4 MiB + 10 bytes, renamed into place so the first poll sees all of it.
    const fs::path staging = temp_root / "blob.staging";
    {
      std::ofstream out(staging, std::ios::binary | std::ios::trunc);
      const std::string filler(1024 * 1024, 'x');
      out << "ERROR";
      out << filler.substr(5);
      out << filler << filler << filler;
      out << std::string(10, 'x');
    }
    fs::create_directories(blob.parent_path());
    fs::rename(staging, blob);

    symptomops::session::StopSignal stop;
    bool run_ok = false;
    std::string run_error;
    std::thread runner([&] { run_ok = watcher.Run(stop, run_error); });
    if (!WaitUntil([&watcher] { return watcher.LinesScanned() >= 4U; })) {
      Fail("large unterminated file was not scanned");
    }
    (void)stop.Request();
    runner.join();
    if (!run_ok) {
      Fail("watcher run failed: " + run_error);
    }
    if (watcher.LinesScanned() != 5U || watcher.MatchedCount() != 1U) {
      Fail("expected four 1 MiB pieces plus the final tail, one of them matching; scanned " +
           std::to_string(watcher.LinesScanned()));
    }
    if (watcher.WatchErrorCount() != 0U) {
      Fail("no watch error expected: " + watcher.LastWatchError());
    }
    const std::vector<std::string> messages = Drain(channel);
    if (messages.size() != 1U || messages.front().rfind("ERROR", 0) != 0U ||
        messages.front().size() > 8U * 1024U) {
      Fail("over-long line should be reported once with a capped message");
    }
    AssertContains(messages.front(), "[truncated ");
  }

  // A watched directory replaced by a file is watched as a file from then on.
  {
    const fs::path swapped = temp_root / "swapped";
    fs::create_directories(swapped);
    symptomops::tests::common::TouchFile(swapped / "core.1");
    symptomops::session::BoundedChannel<symptomops::session::ErrorEvent> channel(8);
    symptomops::watch::LogWatcher watcher(
        swapped.string(), symptomops::watch::KeywordMatcher({"ERROR"}),
        std::chrono::milliseconds(5), symptomops::session::ChannelWriter(channel, swapped.string()),
        logger);

    fs::remove_all(swapped);
    symptomops::tests::common::AppendLines(swapped, {"ERROR now a file"});

    symptomops::session::StopSignal stop;
    std::string run_error;
    std::thread runner([&] { (void)watcher.Run(stop, run_error); });
    if (!WaitUntil([&watcher] { return watcher.MatchedCount() >= 1U; })) {
      Fail("file replacing the directory was not read");
    }
    (void)stop.Request();
    runner.join();

    const std::vector<std::string> messages = Drain(channel);
    if (messages.size() != 1U || messages.front() != "ERROR now a file") {
      Fail("unexpected output after directory was replaced");
    }
    fs::path slice;
    std::string error;
    if (!watcher.ExportSessionSlice(temp_root / "watched", slice, error)) {
      Fail("slice export failed: " + error);
    }
    if (slice.extension() != ".log") {
      Fail("expected a file slice, got " + slice.string());
    }
    AssertContains(ReadFileToString(slice), "ERROR now a file");
  }

  AssertContains(log_output.str(), "watched file truncated");
  RemovePathBestEffort(temp_root);
  return 0;
}
