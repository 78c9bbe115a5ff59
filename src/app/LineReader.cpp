#include "app/LineReader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace ssample::app {

LineReader::LineReader(int fd, Reservoir& reservoir, Termination& term,
                       std::vector<std::unique_ptr<LineSink>> sinks)
    : fd_(fd), reservoir_(reservoir), term_(term), sinks_(std::move(sinks)),
      sink_failed_(sinks_.size(), false) {}

LineReader::~LineReader() { stop(); }

void LineReader::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void LineReader::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

bool LineReader::handle_line(std::string_view line, const std::stop_token& st) {
  if (term_.stop_requested() || st.stop_requested()) {
    std::fprintf(stderr, "ssample: reader: got interrupt\n");
    return false;
  }
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  for (size_t i = 0; i < sinks_.size(); ++i) {
    if (!sinks_[i]->write_line(line) && !sink_failed_[i]) {
      // report once; keep sampling
      std::fprintf(stderr, "ssample: reader: write to %s failed: %s\n",
                   sinks_[i]->name().c_str(), sinks_[i]->last_error().c_str());
      sink_failed_[i] = true;
    }
  }
  reservoir_.admit(std::string(line));
  return true;
}

void LineReader::run(std::stop_token st) {
  std::string pending;
  char buf[64 * 1024];
  bool exhausted = false;

  while (!exhausted) {
    if (term_.stop_requested() || st.stop_requested()) {
      std::fprintf(stderr, "ssample: reader: got interrupt\n");
      close_sinks();
      return;
    }

    struct pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    int rv = ::poll(&pfd, 1, kPollIntervalMs);
    if (rv < 0) {
      if (errno == EINTR) continue;
      std::fprintf(stderr, "ssample: reader: poll failed: %s\n", std::strerror(errno));
      break;
    }
    if (rv == 0) continue;

    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      std::fprintf(stderr, "ssample: reader: read error: %s\n", std::strerror(errno));
      break;
    }
    if (n == 0) {
      exhausted = true;
      break;
    }

    pending.append(buf, static_cast<size_t>(n));
    size_t start = 0;
    for (;;) {
      size_t nl = pending.find('\n', start);
      if (nl == std::string::npos) break;
      if (!handle_line(std::string_view(pending).substr(start, nl - start), st)) {
        close_sinks();
        return;
      }
      start = nl + 1;
    }
    pending.erase(0, start);
  }

  if (exhausted) {
    // final record without a trailing newline
    if (!pending.empty() && !handle_line(pending, st)) {
      close_sinks();
      return;
    }
    std::fprintf(stderr, "ssample: reader: input exhausted after %llu lines\n",
                 static_cast<unsigned long long>(reservoir_.seen()));
  }
  close_sinks();
  term_.trigger(StopReason::InputExhausted);
}

void LineReader::close_sinks() {
  for (auto& s : sinks_) {
    if (!s->close()) {
      std::fprintf(stderr, "ssample: reader: closing %s failed\n", s->name().c_str());
    }
  }
}

} // namespace ssample::app
