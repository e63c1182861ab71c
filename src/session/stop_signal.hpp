#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace symptomops::session {

// One-shot broadcast flag. Once requested it stays requested; every waiter is
// released immediately.
class StopSignal {
public:
  StopSignal() = default;
  StopSignal(const StopSignal&) = delete;
  StopSignal& operator=(const StopSignal&) = delete;

  // Returns true only for the call that actually flipped the flag.
  bool Request();
  bool IsRequested() const;

  // Cancellable sleep: returns true as soon as stop is requested, false when
  // `timeout` elapsed without a stop.
  bool WaitFor(std::chrono::milliseconds timeout) const;

  void Wait() const;

private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::atomic<bool> requested_{false};
};

// Completion latch for a single task (the exerciser). Carries the exit code
// reported by the task.
class CompletionSignal {
public:
  CompletionSignal() = default;
  CompletionSignal(const CompletionSignal&) = delete;
  CompletionSignal& operator=(const CompletionSignal&) = delete;

  void Complete(int exit_code);
  bool IsComplete() const;
  int ExitCode() const;

  // Returns true when the task completed within `timeout`.
  bool WaitFor(std::chrono::milliseconds timeout) const;

private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  bool complete_ = false;
  int exit_code_ = 0;
};

} // namespace symptomops::session
