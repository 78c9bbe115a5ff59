#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace ssample::app {

enum class StopReason { None, InputExhausted, Interrupted };

[[nodiscard]] const char* stop_reason_name(StopReason r);

// Single-fire completion signal: RUNNING -> STOPPED, never back.
// Triggered by the line reader (end of input) or the signal watcher
// (interrupt), whichever comes first; the main flow waits on it.
class Termination {
public:
  Termination() = default;
  Termination(const Termination&) = delete;
  Termination& operator=(const Termination&) = delete;

  // Returns true only for the call that performed the transition.
  bool trigger(StopReason why);

  [[nodiscard]] bool stop_requested() const { return stopped_.load(std::memory_order_acquire); }
  [[nodiscard]] std::stop_token token() const { return source_.get_token(); }
  [[nodiscard]] StopReason reason() const;

  // Block until stopped. Returns the reason of the first trigger.
  StopReason wait();
  // Returns false on timeout.
  bool wait_for(std::chrono::milliseconds timeout);

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> stopped_{false};
  StopReason reason_{StopReason::None};
  std::stop_source source_;
};

} // namespace ssample::app
