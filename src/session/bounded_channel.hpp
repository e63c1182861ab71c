#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace symptomops::session {

// Fixed-capacity multi-producer / single-consumer queue.
//
// - Send blocks while the queue is full (no event is ever dropped).
// - Close wakes every blocked producer and the consumer. Values already queued
//   are still handed out by Receive until the queue is empty.
// - Send after Close is rejected and counted instead of being undefined.
template <typename T>
class BoundedChannel {
public:
  explicit BoundedChannel(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  // Returns false when the channel was closed before (or while) waiting for
  // room; the value is discarded and `sends_after_close` is incremented.
  bool Send(T value) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!closed_ && queue_.size() >= capacity_) {
      ++blocked_sends_;
    }
    not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
    if (closed_) {
      ++sends_after_close_;
      return false;
    }
    queue_.push_back(std::move(value));
    ++total_sent_;
    high_water_ = std::max(high_water_, queue_.size());
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Blocks until a value is available. Returns std::nullopt once the channel
  // is closed and fully drained.
  std::optional<T> Receive() {
    std::unique_lock<std::mutex> lock(mu_);
    not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return value;
  }

  // Closes the channel. Only the first call has an effect and returns true.
  bool Close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++close_calls_;
      if (closed_) {
        return false;
      }
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
    return true;
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

  std::size_t Capacity() const {
    return capacity_;
  }

  std::uint64_t TotalSent() const {
    std::lock_guard<std::mutex> lock(mu_);
    return total_sent_;
  }

  // Number of Send calls that found the queue full and had to wait.
  std::uint64_t BlockedSends() const {
    std::lock_guard<std::mutex> lock(mu_);
    return blocked_sends_;
  }

  std::uint64_t SendsAfterClose() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sends_after_close_;
  }

  std::uint64_t CloseCalls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return close_calls_;
  }

  std::size_t HighWaterMark() const {
    std::lock_guard<std::mutex> lock(mu_);
    return high_water_;
  }

private:
  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<T> queue_;
  bool closed_ = false;
  std::uint64_t total_sent_ = 0;
  std::uint64_t blocked_sends_ = 0;
  std::uint64_t sends_after_close_ = 0;
  std::uint64_t close_calls_ = 0;
  std::size_t high_water_ = 0;
};

} // namespace symptomops::session
