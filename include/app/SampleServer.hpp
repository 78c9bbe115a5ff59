#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <stop_token>
#include <thread>
#include "app/Reservoir.hpp"
#include "app/SampleView.hpp"

namespace ssample::app {

// Split "host:port", ":port" or "[v6addr]:port". Empty host means any address.
[[nodiscard]] bool split_listen_address(std::string_view addr, std::string& host, std::string& port);

// HTTP exposure of the reservoir. listen() binds synchronously so a bad
// address fails at startup; start() runs an io_uring event loop on its own
// thread that serves any number of connections concurrently, each request
// answered from a fresh snapshot.
class SampleServer {
public:
  SampleServer(const Reservoir& reservoir, std::string listen_addr);
  ~SampleServer();
  SampleServer(const SampleServer&) = delete;
  SampleServer& operator=(const SampleServer&) = delete;

  [[nodiscard]] bool listen();
  void start();
  void stop();

  // Port actually bound (resolves ":0"); 0 before listen().
  [[nodiscard]] uint16_t port() const { return bound_port_; }

  static constexpr size_t kMaxConnections = 1024;

private:
  struct Connection;
  void run(std::stop_token st);

  SampleView view_;
  std::string addr_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  uint16_t bound_port_{0};
  std::jthread thread_;
};

} // namespace ssample::app
