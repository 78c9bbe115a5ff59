#include "app/SignalWatcher.hpp"
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <pthread.h>

namespace ssample::app {

static sigset_t termination_set() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

bool block_termination_signals() {
  sigset_t set = termination_set();
  int rc = ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
  if (rc != 0) {
    std::fprintf(stderr, "ssample: pthread_sigmask failed: %s\n", std::strerror(rc));
    return false;
  }
  return true;
}

SignalWatcher::~SignalWatcher() { stop(); }

void SignalWatcher::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void SignalWatcher::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void SignalWatcher::run(std::stop_token st) {
  const sigset_t set = termination_set();
  // short timeout so stop() is honoured without sending ourselves a signal
  const struct timespec tick{.tv_sec = 0, .tv_nsec = 100'000'000};
  while (!st.stop_requested()) {
    int sig = ::sigtimedwait(&set, nullptr, &tick);
    if (sig < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      std::fprintf(stderr, "ssample: signal watcher: sigtimedwait failed: %s\n", std::strerror(errno));
      return;
    }
    std::fprintf(stderr, "ssample: got signal: %s\n", ::strsignal(sig));
    term_.trigger(StopReason::Interrupted);
  }
}

} // namespace ssample::app
