#include "app/SampleServer.hpp"

namespace ssample::app {

bool split_listen_address(std::string_view addr, std::string& host, std::string& port) {
  std::string_view h, p;
  if (addr.starts_with('[')) {
    auto close = addr.find(']');
    if (close == std::string_view::npos || close + 1 >= addr.size() || addr[close + 1] != ':') return false;
    h = addr.substr(1, close - 1);
    p = addr.substr(close + 2);
  } else {
    auto colon = addr.rfind(':');
    if (colon == std::string_view::npos) return false;
    h = addr.substr(0, colon);
    if (h.find(':') != std::string_view::npos) return false; // bare IPv6 needs brackets
    p = addr.substr(colon + 1);
  }
  if (p.empty()) return false;
  host.assign(h);
  port.assign(p);
  return true;
}

} // namespace ssample::app
