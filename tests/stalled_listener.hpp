#pragma once
// Loopback listener that never accepts. With a backlog of zero the kernel
// queues one handshake and silently drops later SYNs, so further dials to it
// stay in flight until the client gives up.

#include <string>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "floodnet/net_address.hpp"

namespace floodnet::test {

struct StalledListener {
  int         fd{-1};
  std::string address;

  StalledListener() {
    sockaddr_storage ss{};
    socklen_t len = 0;
    std::string err;
    if (!net::parse_address("127.0.0.1:0", ss, len, err)) return;
    fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return;
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&ss), len) != 0 ||
        ::listen(fd, 0) != 0 ||
        !net::local_address(fd, address, err)) {
      address.clear();
    }
  }

  ~StalledListener() {
    if (fd >= 0) ::close(fd);
  }

  StalledListener(const StalledListener&) = delete;
  StalledListener& operator=(const StalledListener&) = delete;

  bool ok() const { return fd >= 0 && !address.empty(); }
};

} // namespace floodnet::test
