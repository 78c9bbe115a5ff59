#include "app/LineReader.hpp"
#include "app/LineSink.hpp"
#include "app/Options.hpp"
#include "app/Reservoir.hpp"
#include "app/SampleServer.hpp"
#include "app/SampleView.hpp"
#include "app/SignalWatcher.hpp"
#include "app/Termination.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

using namespace ssample;

// Write the whole buffer to fd, retrying short writes. False on error.
static bool write_all(int fd, const std::string& buf) {
  size_t off = 0;
  while (off < buf.size()) {
    ssize_t n = ::write(fd, buf.data() + off, buf.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

int main(int argc, char** argv) {
  auto parsed = app::parse_options(argc, argv);
  if (parsed.status == app::ParseStatus::Help) {
    std::fputs(app::usage().c_str(), stdout);
    return 0;
  }
  if (parsed.status == app::ParseStatus::Error) {
    std::fprintf(stderr, "ssample: %s\n%s", parsed.error.c_str(), app::usage().c_str());
    return 2;
  }
  const app::Options& opts = parsed.options;
  if (!opts.config_path.empty()) {
    std::fprintf(stderr, "ssample: using config %s\n", opts.config_path.c_str());
  }

  // Signals must be masked before any thread exists so only the watcher sees them.
  if (!app::block_termination_signals()) return 1;

  std::vector<std::unique_ptr<app::LineSink>> sinks;
  if (!opts.append_path.empty()) {
    auto s = app::FileSink::open(opts.append_path);
    if (!s) return 1;
    sinks.push_back(std::move(s));
  }
  if (!opts.gzip_path.empty()) {
    auto s = app::GzipSink::open(opts.gzip_path);
    if (!s) return 1;
    sinks.push_back(std::move(s));
  }
  if (opts.echo) sinks.push_back(std::make_unique<app::StdoutSink>());

  app::Reservoir reservoir(opts.lines);
  app::Termination term;

  std::optional<app::SampleServer> server;
  if (!opts.http_listen.empty()) {
    server.emplace(reservoir, opts.http_listen);
    if (!server->listen()) return 1;
  }

  app::SignalWatcher watcher(term);
  watcher.start();
  app::LineReader reader(STDIN_FILENO, reservoir, term, std::move(sinks));
  reader.start();
  if (server) server->start();

  app::StopReason why = term.wait();

  // Join the reader first: nothing is admitted after this point, and the
  // tee sinks (gzip trailer included) are closed.
  reader.stop();
  if (server) server->stop();
  watcher.stop();

  auto snap = reservoir.snapshot();
  std::fprintf(stderr, "ssample: %s; kept %zu of %llu lines\n", app::stop_reason_name(why),
               snap.entries.size(), static_cast<unsigned long long>(snap.seen));

  std::fflush(stdout); // echo output must precede the sample
  if (!write_all(STDOUT_FILENO, app::render_text(snap))) {
    std::fprintf(stderr, "ssample: writing sample to stdout failed: %s\n", std::strerror(errno));
    return 1;
  }
  return 0;
}
