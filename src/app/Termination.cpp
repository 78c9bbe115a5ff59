#include "app/Termination.hpp"

namespace ssample::app {

const char* stop_reason_name(StopReason r) {
  switch (r) {
    case StopReason::None: return "none";
    case StopReason::InputExhausted: return "input exhausted";
    case StopReason::Interrupted: return "interrupted";
  }
  return "unknown";
}

bool Termination::trigger(StopReason why) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopped_.load(std::memory_order_relaxed)) return false;
    reason_ = why;
    stopped_.store(true, std::memory_order_release);
  }
  source_.request_stop();
  cv_.notify_all();
  return true;
}

StopReason Termination::reason() const {
  std::lock_guard<std::mutex> lk(mu_);
  return reason_;
}

StopReason Termination::wait() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this]{ return stopped_.load(std::memory_order_relaxed); });
  return reason_;
}

bool Termination::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [this]{ return stopped_.load(std::memory_order_relaxed); });
}

} // namespace ssample::app
