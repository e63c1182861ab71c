#include "session/stop_signal.hpp"

namespace symptomops::session {

bool StopSignal::Request() {
  bool flipped = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    flipped = !requested_.exchange(true);
  }
  cv_.notify_all();
  return flipped;
}

bool StopSignal::IsRequested() const {
  return requested_.load();
}

bool StopSignal::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  return cv_.wait_for(lock, timeout, [this] { return requested_.load(); });
}

void StopSignal::Wait() const {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this] { return requested_.load(); });
}

void CompletionSignal::Complete(int exit_code) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (complete_) {
      return;
    }
    complete_ = true;
    exit_code_ = exit_code;
  }
  cv_.notify_all();
}

bool CompletionSignal::IsComplete() const {
  std::lock_guard<std::mutex> lock(mu_);
  return complete_;
}

int CompletionSignal::ExitCode() const {
  std::lock_guard<std::mutex> lock(mu_);
  return exit_code_;
}

bool CompletionSignal::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  return cv_.wait_for(lock, timeout, [this] { return complete_; });
}

} // namespace symptomops::session
