#ifdef SSAMPLE_HAVE_URING

#include "app/SampleServer.hpp"
#include <liburing.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unordered_map>

namespace ssample::app {

// user_data values for the two fixed poll requests; anything else is a Connection*
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

enum class ConnState : uint8_t { Receiving, Sending };

struct SampleServer::Connection {
  int fd{-1};
  ConnState state{ConnState::Receiving};
  std::string request;
  std::string response;
  size_t sent{0};
  char buf[4096];
};

namespace {

io_uring_sqe* acquire_sqe(io_uring* ring) {
  io_uring_sqe* sqe = io_uring_get_sqe(ring);
  if (!sqe) {
    // submission queue full: flush it and retry once
    io_uring_submit(ring);
    sqe = io_uring_get_sqe(ring);
  }
  return sqe;
}

} // namespace

SampleServer::SampleServer(const Reservoir& reservoir, std::string listen_addr)
    : view_(reservoir), addr_(std::move(listen_addr)) {}

SampleServer::~SampleServer() {
  stop();
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
}

bool SampleServer::listen() {
  std::string host, port;
  if (!split_listen_address(addr_, host, port)) {
    std::fprintf(stderr, "ssample: http: bad listen address '%s' (want host:port or :port)\n", addr_.c_str());
    return false;
  }

  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  struct addrinfo* res = nullptr;
  int gai = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &res);
  if (gai != 0) {
    std::fprintf(stderr, "ssample: http: %s: %s\n", addr_.c_str(), ::gai_strerror(gai));
    return false;
  }

  int last_errno = 0;
  for (auto* ai = res; ai; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol);
    if (fd < 0) { last_errno = errno; continue; }
    int optval = 1;
    (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));
    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) < 0 || ::listen(fd, SOMAXCONN) < 0) {
      last_errno = errno;
      ::close(fd);
      continue;
    }
    listen_fd_ = fd;
    break;
  }
  ::freeaddrinfo(res);

  if (listen_fd_ < 0) {
    std::fprintf(stderr, "ssample: http: bind(%s) failed: %s\n", addr_.c_str(), std::strerror(last_errno));
    return false;
  }

  struct sockaddr_storage bound{};
  socklen_t blen = sizeof(bound);
  if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&bound), &blen) == 0) {
    if (bound.ss_family == AF_INET)
      bound_port_ = ntohs(reinterpret_cast<struct sockaddr_in*>(&bound)->sin_port);
    else if (bound.ss_family == AF_INET6)
      bound_port_ = ntohs(reinterpret_cast<struct sockaddr_in6*>(&bound)->sin6_port);
  }

  // eventfd for clean shutdown
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    std::fprintf(stderr, "ssample: http: eventfd() failed: %s\n", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }
  return true;
}

void SampleServer::start() {
  if (listen_fd_ < 0 || thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void SampleServer::stop() {
  if (!thread_.joinable()) return;
  if (stop_eventfd_ >= 0) {
    uint64_t val = 1;
    (void)::write(stop_eventfd_, &val, sizeof(val));
  }
  thread_.request_stop();
  thread_.join();
}

void SampleServer::run(std::stop_token st) {
  struct io_uring ring{};
  int rc = io_uring_queue_init(256, &ring, 0);
  if (rc < 0) {
    std::fprintf(stderr, "ssample: http: io_uring_queue_init() failed: %s\n", std::strerror(-rc));
    return;
  }

  std::unordered_map<Connection*, std::unique_ptr<Connection>> conns;

  auto submit_poll = [&](int fd, UringTag tag) {
    io_uring_sqe* sqe = acquire_sqe(&ring);
    if (!sqe) return false;
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
    return true;
  };

  auto close_conn = [&](Connection* c) {
    ::close(c->fd);
    conns.erase(c);
  };

  auto arm_recv = [&](Connection* c) {
    io_uring_sqe* sqe = acquire_sqe(&ring);
    if (!sqe) { close_conn(c); return; }
    c->state = ConnState::Receiving;
    io_uring_prep_recv(sqe, c->fd, c->buf, sizeof(c->buf), 0);
    io_uring_sqe_set_data(sqe, c);
  };

  auto arm_send = [&](Connection* c) {
    io_uring_sqe* sqe = acquire_sqe(&ring);
    if (!sqe) { close_conn(c); return; }
    c->state = ConnState::Sending;
    io_uring_prep_send(sqe, c->fd, c->response.data() + c->sent,
                       c->response.size() - c->sent, MSG_NOSIGNAL);
    io_uring_sqe_set_data(sqe, c);
  };

  auto answer = [&](Connection* c, const HttpResponse& resp) {
    c->response = serialize_response(resp);
    c->sent = 0;
    arm_send(c);
  };

  if (!submit_poll(listen_fd_, UringTag::ListenPoll) || !submit_poll(stop_eventfd_, UringTag::StopPoll)) {
    std::fprintf(stderr, "ssample: http: could not arm io_uring polls\n");
    io_uring_queue_exit(&ring);
    return;
  }
  io_uring_submit(&ring);

  std::fprintf(stderr, "ssample: http: serving on %s (port %u)\n", addr_.c_str(), static_cast<unsigned>(bound_port_));

  bool stopping = false;
  while (!stopping && !st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      std::fprintf(stderr, "ssample: http: io_uring_wait_cqe failed: %s\n", std::strerror(-ret));
      break;
    }

    // drain every completion that is ready
    unsigned head;
    unsigned seen = 0;
    io_uring_for_each_cqe(&ring, head, cqe) {
      ++seen;
      uint64_t data = io_uring_cqe_get_data64(cqe);
      int res = cqe->res;

      if (data == static_cast<uint64_t>(UringTag::StopPoll)) {
        stopping = true;
        continue;
      }

      if (data == static_cast<uint64_t>(UringTag::ListenPoll)) {
        // accept everything pending, then re-arm
        for (;;) {
          int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
          if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
              std::fprintf(stderr, "ssample: http: accept failed: %s\n", std::strerror(errno));
            break;
          }
          if (conns.size() >= kMaxConnections) {
            ::close(client_fd);
            continue;
          }
          int one = 1;
          (void)::setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
          auto conn = std::make_unique<Connection>();
          conn->fd = client_fd;
          Connection* c = conn.get();
          conns.emplace(c, std::move(conn));
          arm_recv(c);
        }
        if (!submit_poll(listen_fd_, UringTag::ListenPoll)) stopping = true;
        continue;
      }

      auto* c = reinterpret_cast<Connection*>(static_cast<uintptr_t>(data));
      if (conns.find(c) == conns.end()) continue;

      if (c->state == ConnState::Receiving) {
        if (res <= 0) { close_conn(c); continue; }
        c->request.append(c->buf, static_cast<size_t>(res));
        size_t end = find_head_end(c->request);
        if (end != std::string::npos) {
          answer(c, view_.handle(std::string_view(c->request).substr(0, end)));
        } else if (c->request.size() > kMaxRequestHead) {
          answer(c, HttpResponse{431, "text/plain", "431 Request Header Fields Too Large\n"});
        } else {
          arm_recv(c);
        }
      } else {
        if (res <= 0) { close_conn(c); continue; }
        c->sent += static_cast<size_t>(res);
        if (c->sent >= c->response.size()) {
          (void)::shutdown(c->fd, SHUT_WR);
          close_conn(c);
        } else {
          arm_send(c);
        }
      }
    }
    io_uring_cq_advance(&ring, seen);
    io_uring_submit(&ring);
  }

  // Cleanup: tearing down the ring cancels in-flight ops before buffers go away
  io_uring_queue_exit(&ring);
  for (auto& [ptr, conn] : conns) ::close(conn->fd);
  conns.clear();
}

} // namespace ssample::app

#endif // SSAMPLE_HAVE_URING
