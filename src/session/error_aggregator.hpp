#pragma once

#include "core/logging/logger.hpp"
#include "events/emitter.hpp"
#include "session/bounded_channel.hpp"
#include "session/error_event.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace symptomops::session {

// Receives every aggregated event, in arrival order, on the consumer thread.
class ErrorEventSink {
public:
  virtual ~ErrorEventSink() = default;
  virtual void Consume(const ErrorEvent& event, std::uint64_t sequence) = 0;
};

// In-memory buffer backing error_report.json.
class ReportBufferSink final : public ErrorEventSink {
public:
  void Consume(const ErrorEvent& event, std::uint64_t sequence) override;

  std::vector<ErrorEvent> Events() const;
  std::map<std::string, std::uint64_t> CountsBySource() const;
  std::uint64_t Total() const;

private:
  mutable std::mutex mu_;
  std::vector<ErrorEvent> events_;
  std::map<std::string, std::uint64_t> counts_;
};

// One ERROR log line per detected event.
class LoggerSink final : public ErrorEventSink {
public:
  explicit LoggerSink(core::logging::Logger& logger) : logger_(logger) {}
  void Consume(const ErrorEvent& event, std::uint64_t sequence) override;

private:
  core::logging::Logger& logger_;
};

// Appends `error_detected` lines to the session timeline. A write failure is
// logged once and counted; it never stalls the consumer.
class EmitterSink final : public ErrorEventSink {
public:
  EmitterSink(events::Emitter& emitter, std::string session_id, core::logging::Logger& logger);
  void Consume(const ErrorEvent& event, std::uint64_t sequence) override;

  std::uint64_t WriteFailures() const {
    return write_failures_.load();
  }

private:
  events::Emitter& emitter_;
  const std::string session_id_;
  core::logging::Logger& logger_;
  std::atomic<std::uint64_t> write_failures_{0};
};

// Write-end handle owned by exactly one producer task.
class ChannelWriter {
public:
  ChannelWriter(BoundedChannel<ErrorEvent>& channel, std::string source);

  // Blocks while the channel is full. Returns false once the channel is
  // closed; the caller must stop producing.
  bool Send(std::string message);
  bool Send(ErrorEvent event);

  const std::string& source() const {
    return source_;
  }
  std::uint64_t Sent() const {
    return sent_;
  }

private:
  BoundedChannel<ErrorEvent>* channel_;
  std::string source_;
  std::uint64_t sent_ = 0;
};

// Fan-in point for every producer. Owns the bounded channel and its single
// consumer thread.
//
// Lifecycle: Start() -> producers Send via ChannelWriter -> Close().
// Close() must only be called once every producer has stopped; it drains the
// remaining events into the sinks before returning.
class ErrorAggregator {
public:
  static constexpr std::size_t kDefaultCapacity = 100;

  // Sinks are not owned and must outlive the aggregator.
  ErrorAggregator(std::size_t capacity, std::vector<ErrorEventSink*> sinks);
  ~ErrorAggregator();

  ErrorAggregator(const ErrorAggregator&) = delete;
  ErrorAggregator& operator=(const ErrorAggregator&) = delete;

  bool Start(std::string& error);
  ChannelWriter MakeWriter(std::string source);

  // Closes the channel and joins the consumer. Returns false on every call
  // after the first.
  bool Close();

  std::uint64_t Consumed() const {
    return consumed_.load();
  }
  std::size_t Capacity() const {
    return channel_.Capacity();
  }
  std::uint64_t CloseCalls() const {
    return channel_.CloseCalls();
  }
  std::uint64_t SendsAfterClose() const {
    return channel_.SendsAfterClose();
  }
  std::uint64_t BlockedSends() const {
    return channel_.BlockedSends();
  }
  std::size_t HighWaterMark() const {
    return channel_.HighWaterMark();
  }
  bool IsClosed() const {
    return channel_.IsClosed();
  }

private:
  void ConsumeLoop();

  BoundedChannel<ErrorEvent> channel_;
  std::vector<ErrorEventSink*> sinks_;
  std::thread consumer_;
  std::atomic<std::uint64_t> consumed_{0};
  bool started_ = false;
};

} // namespace symptomops::session
