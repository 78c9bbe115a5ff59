#pragma once
#include <stop_token>
#include <thread>
#include "app/Termination.hpp"

namespace ssample::app {

// Mask SIGINT and SIGTERM for the calling thread. Call from main before any
// other thread is created so every thread inherits the mask and the signals
// are only ever consumed by SignalWatcher.
[[nodiscard]] bool block_termination_signals();

// Waits for SIGINT/SIGTERM on a dedicated thread and turns the first one
// into Termination::trigger(StopReason::Interrupted).
class SignalWatcher {
public:
  explicit SignalWatcher(Termination& term) : term_(term) {}
  ~SignalWatcher();
  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

  void start();
  void stop();

private:
  void run(std::stop_token st);

  Termination& term_;
  std::jthread thread_{};
};

} // namespace ssample::app
