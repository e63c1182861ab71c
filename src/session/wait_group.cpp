#include "session/wait_group.hpp"

namespace symptomops::session {

void WaitGroup::Add(std::size_t count) {
  std::lock_guard<std::mutex> lock(mu_);
  pending_ += count;
  total_added_ += count;
}

bool WaitGroup::Done(std::string& error) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (pending_ == 0U) {
      error = "wait group Done() called with no pending task";
      return false;
    }
    --pending_;
    if (pending_ != 0U) {
      return true;
    }
  }
  cv_.notify_all();
  return true;
}

void WaitGroup::Wait() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this] { return pending_ == 0U; });
}

bool WaitGroup::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  return cv_.wait_for(lock, timeout, [this] { return pending_ == 0U; });
}

std::size_t WaitGroup::Pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_;
}

std::size_t WaitGroup::TotalAdded() const {
  std::lock_guard<std::mutex> lock(mu_);
  return total_added_;
}

} // namespace symptomops::session
