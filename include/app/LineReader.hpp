#pragma once
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "app/LineSink.hpp"
#include "app/Reservoir.hpp"
#include "app/Termination.hpp"

namespace ssample::app {

// Producer task: reads newline-delimited records from an fd, copies each
// to the configured sinks and admits it into the reservoir. Checks the
// termination signal before every record and while idle, so an interrupt
// stops it without draining the rest of the input. End of input (or a read
// fault) triggers termination with StopReason::InputExhausted.
class LineReader {
public:
  LineReader(int fd, Reservoir& reservoir, Termination& term,
             std::vector<std::unique_ptr<LineSink>> sinks = {});
  ~LineReader();
  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  void start();
  // Request stop and join. Sinks are closed by the time this returns.
  void stop();

  static constexpr int kPollIntervalMs = 100;

private:
  void run(std::stop_token st);
  // Returns false once the record was refused because termination fired.
  bool handle_line(std::string_view line, const std::stop_token& st);
  void close_sinks();

  int fd_;
  Reservoir& reservoir_;
  Termination& term_;
  std::vector<std::unique_ptr<LineSink>> sinks_;
  std::vector<bool> sink_failed_;
  std::jthread thread_{};
};

} // namespace ssample::app
