#include "session/error_aggregator.hpp"

#include <chrono>
#include <system_error>
#include <utility>

namespace symptomops::session {

void ReportBufferSink::Consume(const ErrorEvent& event, std::uint64_t /*sequence*/) {
  std::lock_guard<std::mutex> lock(mu_);
  events_.push_back(event);
  ++counts_[event.source];
}

std::vector<ErrorEvent> ReportBufferSink::Events() const {
  std::lock_guard<std::mutex> lock(mu_);
  return events_;
}

std::map<std::string, std::uint64_t> ReportBufferSink::CountsBySource() const {
  std::lock_guard<std::mutex> lock(mu_);
  return counts_;
}

std::uint64_t ReportBufferSink::Total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return events_.size();
}

void LoggerSink::Consume(const ErrorEvent& event, std::uint64_t sequence) {
  const std::string sequence_text = std::to_string(sequence);
  logger_.Error("error detected", {{"source", event.source},
                                   {"sequence", sequence_text},
                                   {"line", event.message}});
}

EmitterSink::EmitterSink(events::Emitter& emitter, std::string session_id,
                         core::logging::Logger& logger)
    : emitter_(emitter), session_id_(std::move(session_id)), logger_(logger) {}

void EmitterSink::Consume(const ErrorEvent& event, std::uint64_t sequence) {
  std::string error;
  const bool ok = emitter_.EmitErrorDetected(
      {
          .ts = event.timestamp,
          .session_id = session_id_,
          .source = event.source,
          .message = event.message,
          .sequence = sequence,
      },
      error);
  if (!ok && write_failures_.fetch_add(1) == 0U) {
    logger_.Warn("failed to append error_detected event", {{"error", error}});
  }
}

ChannelWriter::ChannelWriter(BoundedChannel<ErrorEvent>& channel, std::string source)
    : channel_(&channel), source_(std::move(source)) {}

bool ChannelWriter::Send(std::string message) {
  ErrorEvent event;
  event.timestamp = std::chrono::system_clock::now();
  event.source = source_;
  event.message = std::move(message);
  return Send(std::move(event));
}

bool ChannelWriter::Send(ErrorEvent event) {
  if (event.source.empty()) {
    event.source = source_;
  }
  if (!channel_->Send(std::move(event))) {
    return false;
  }
  ++sent_;
  return true;
}

ErrorAggregator::ErrorAggregator(std::size_t capacity, std::vector<ErrorEventSink*> sinks)
    : channel_(capacity), sinks_(std::move(sinks)) {}

ErrorAggregator::~ErrorAggregator() {
  if (!channel_.IsClosed()) {
    (void)Close();
  }
}

bool ErrorAggregator::Start(std::string& error) {
  if (started_) {
    error = "error aggregator already started";
    return false;
  }
  if (channel_.IsClosed()) {
    error = "error aggregator already closed";
    return false;
  }
  try {
    consumer_ = std::thread([this] { ConsumeLoop(); });
  } catch (const std::system_error& ex) {
    error = std::string("failed to start aggregator consumer: ") + ex.what();
    return false;
  }
  started_ = true;
  return true;
}

ChannelWriter ErrorAggregator::MakeWriter(std::string source) {
  return ChannelWriter(channel_, std::move(source));
}

bool ErrorAggregator::Close() {
  if (!channel_.Close()) {
    return false;
  }
  if (consumer_.joinable()) {
    consumer_.join();
  }
  return true;
}

void ErrorAggregator::ConsumeLoop() {
  while (true) {
    std::optional<ErrorEvent> event = channel_.Receive();
    if (!event.has_value()) {
      return;
    }
    const std::uint64_t sequence = consumed_.fetch_add(1) + 1U;
    for (ErrorEventSink* sink : sinks_) {
      sink->Consume(event.value(), sequence);
    }
  }
}

} // namespace symptomops::session
