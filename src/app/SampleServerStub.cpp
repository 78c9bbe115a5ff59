#include "app/SampleServer.hpp"
#include <cstdio>

namespace ssample::app {

SampleServer::SampleServer(const Reservoir& reservoir, std::string listen_addr)
    : view_(reservoir), addr_(std::move(listen_addr)) {}

SampleServer::~SampleServer() = default;

bool SampleServer::listen() {
  std::fprintf(stderr, "ssample: http: built without io_uring support; cannot serve %s\n", addr_.c_str());
  return false;
}

void SampleServer::start() {}
void SampleServer::stop() {}

} // namespace ssample::app
