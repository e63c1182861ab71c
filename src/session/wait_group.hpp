#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>

namespace symptomops::session {

// Join barrier for task threads. Every started task calls Add() before its
// thread is spawned and Done() exactly once when it has stopped.
class WaitGroup {
public:
  WaitGroup() = default;
  WaitGroup(const WaitGroup&) = delete;
  WaitGroup& operator=(const WaitGroup&) = delete;

  void Add(std::size_t count = 1);

  // Returns false (and leaves the counter untouched) on an unbalanced call.
  bool Done(std::string& error);

  // Blocks until the counter reaches zero.
  void Wait();

  // Returns true if the counter reached zero within `timeout`.
  bool WaitFor(std::chrono::milliseconds timeout);

  std::size_t Pending() const;
  std::size_t TotalAdded() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::size_t pending_ = 0;
  std::size_t total_added_ = 0;
};

} // namespace symptomops::session
