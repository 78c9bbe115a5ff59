#include "minitest.hpp"
#include "ScriptedSource.hpp"
#include "app/LineReader.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

using namespace std::chrono_literals;
using namespace ssample::app;

namespace {

// Records every line it receives and whether it was closed.
struct RecordingSink final : LineSink {
  explicit RecordingSink(std::vector<std::string>& out, bool& closed) : out_(out), closed_(closed) {}
  bool write_line(std::string_view line) override { out_.emplace_back(line); return true; }
  bool close() override { closed_ = true; return true; }
  const std::string& name() const override { return name_; }
  std::string last_error() const override { return {}; }
  std::vector<std::string>& out_;
  bool& closed_;
  std::string name_{"recording"};
};

struct FailingSink final : LineSink {
  bool write_line(std::string_view) override { ++attempts; return false; }
  bool close() override { return true; }
  const std::string& name() const override { return name_; }
  std::string last_error() const override { return "disk on fire"; }
  int attempts{0};
  std::string name_{"failing"};
};

struct Pipe {
  int rd{-1}, wr{-1};
  Pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) throw std::runtime_error(std::string("pipe2: ") + std::strerror(errno));
    rd = fds[0]; wr = fds[1];
  }
  ~Pipe() { close_write(); if (rd >= 0) ::close(rd); }
  void write(const std::string& s) const {
    if (::write(wr, s.data(), s.size()) != static_cast<ssize_t>(s.size())) throw std::runtime_error("short pipe write");
  }
  void close_write() { if (wr >= 0) { ::close(wr); wr = -1; } }
};

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds limit) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

std::vector<std::string> lines_of(const Reservoir& r) {
  std::vector<std::string> out;
  for (const auto& e : r.snapshot().entries) out.push_back(e.line);
  return out;
}

} // namespace

TEST(reader_splits_lines_and_signals_exhaustion) {
  Pipe p;
  Reservoir res(10);
  Termination term;
  LineReader reader(p.rd, res, term);
  reader.start();
  p.write("alpha\nbeta\r\n\ngam");
  p.write("ma\nlast-without-newline");
  p.close_write();
  ASSERT_TRUE(term.wait_for(3000ms));
  ASSERT_TRUE(term.reason() == StopReason::InputExhausted);
  reader.stop();
  std::vector<std::string> want{"alpha", "beta", "", "gamma", "last-without-newline"};
  ASSERT_TRUE(lines_of(res) == want);
  ASSERT_EQ(res.seen(), 5u);
}

TEST(reader_empty_input) {
  Pipe p;
  Reservoir res(3);
  Termination term;
  LineReader reader(p.rd, res, term);
  p.close_write();
  reader.start();
  ASSERT_TRUE(term.wait_for(3000ms));
  reader.stop();
  ASSERT_EQ(res.seen(), 0u);
  ASSERT_TRUE(res.snapshot().entries.empty());
}

TEST(reader_read_fault_counts_as_exhaustion) {
  // read() on a directory fails with EISDIR
  int dir_fd = ::open("/", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  ASSERT_TRUE(dir_fd >= 0);
  Reservoir res(3);
  Termination term;
  LineReader reader(dir_fd, res, term);
  reader.start();
  bool stopped = term.wait_for(3000ms);
  reader.stop();
  ::close(dir_fd);
  ASSERT_TRUE(stopped);
  ASSERT_TRUE(term.reason() == StopReason::InputExhausted);
  ASSERT_EQ(res.seen(), 0u);
}

// Interrupt before end of input: only records admitted before the
// interrupt was observed end up in the sample.
TEST(reader_stops_on_interrupt_without_draining) {
  Pipe p;
  Reservoir res(10, always_reject());
  Termination term;
  std::vector<std::string> teed;
  bool closed = false;
  std::vector<std::unique_ptr<LineSink>> sinks;
  sinks.push_back(std::make_unique<RecordingSink>(teed, closed));
  LineReader reader(p.rd, res, term, std::move(sinks));
  reader.start();

  p.write("x\ny\n");
  ASSERT_TRUE(wait_until([&]{ return res.seen() == 2; }, 3000ms));
  ASSERT_TRUE(term.trigger(StopReason::Interrupted));
  // the reader is idle in poll(); give it one poll interval to notice
  std::this_thread::sleep_for(std::chrono::milliseconds(LineReader::kPollIntervalMs * 2));
  p.write("z\nw\n");
  std::this_thread::sleep_for(50ms);
  reader.stop();

  std::vector<std::string> want{"x", "y"};
  ASSERT_TRUE(lines_of(res) == want);
  ASSERT_EQ(res.seen(), 2u);
  ASSERT_TRUE(teed == want);
  ASSERT_TRUE(closed);
  ASSERT_TRUE(term.reason() == StopReason::Interrupted);
}

TEST(reader_already_stopped_reads_nothing) {
  Pipe p;
  Reservoir res(100);
  Termination term;
  term.trigger(StopReason::Interrupted);
  LineReader reader(p.rd, res, term);
  p.write("a\nb\nc\n");
  reader.start();
  std::this_thread::sleep_for(50ms);
  reader.stop();
  ASSERT_EQ(res.seen(), 0u);
}

TEST(reader_tees_before_admitting_and_closes_sinks) {
  Pipe p;
  Reservoir res(2, always_reject());
  Termination term;
  std::vector<std::string> teed;
  bool closed = false;
  std::vector<std::unique_ptr<LineSink>> sinks;
  sinks.push_back(std::make_unique<RecordingSink>(teed, closed));
  LineReader reader(p.rd, res, term, std::move(sinks));
  reader.start();
  p.write("1\n2\n3\n4\n");
  p.close_write();
  ASSERT_TRUE(term.wait_for(3000ms));
  reader.stop();
  std::vector<std::string> all{"1", "2", "3", "4"};
  ASSERT_TRUE(teed == all);
  ASSERT_TRUE(closed);
  std::vector<std::string> kept{"1", "2"};
  ASSERT_TRUE(lines_of(res) == kept);
}

TEST(reader_keeps_sampling_when_a_sink_fails) {
  Pipe p;
  Reservoir res(5);
  Termination term;
  auto failing = std::make_unique<FailingSink>();
  auto* raw = failing.get();
  std::vector<std::unique_ptr<LineSink>> sinks;
  sinks.push_back(std::move(failing));
  LineReader reader(p.rd, res, term, std::move(sinks));
  reader.start();
  p.write("a\nb\nc\n");
  p.close_write();
  ASSERT_TRUE(term.wait_for(3000ms));
  reader.stop();
  ASSERT_EQ(res.seen(), 3u);
  ASSERT_EQ(raw->attempts, 3);
}

TEST(reader_large_input_crosses_read_chunks) {
  Pipe p;
  Reservoir res(1000);
  Termination term;
  LineReader reader(p.rd, res, term);
  reader.start();
  std::thread writer([&]{
    std::string line(300, 'q');
    for (int i = 0; i < 1000; ++i) p.write(line + std::to_string(i) + "\n");
    p.close_write();
  });
  writer.join();
  ASSERT_TRUE(term.wait_for(5000ms));
  reader.stop();
  auto snap = res.snapshot();
  ASSERT_EQ(snap.seen, 1000u);
  for (const auto& e : snap.entries) {
    ASSERT_EQ(e.line, std::string(300, 'q') + std::to_string(e.line_number));
  }
}
