// ============================================================================
// acceptor.cpp: implementation for acceptor.hpp
// ============================================================================

#include "floodnet/acceptor.hpp"
#include "floodnet/log.hpp"
#include "floodnet/net_address.hpp"
#include "floodnet/transport/socket_connection.hpp"

#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace floodnet {

Acceptor::Acceptor(ConnectionChannel& out)
: out_(out) {}

Acceptor::~Acceptor() {
  stop();
}

// ---------------------------------------------------------------------------
// listen()
// --------
// socket -> SO_REUSEADDR -> bind -> listen -> non-blocking.
// The listening fd is non-blocking so the accept thread can sit in poll(2)
// and still notice stop().
// ---------------------------------------------------------------------------
bool Acceptor::listen(const std::string& address, std::string& err) {
  sockaddr_storage ss{};
  socklen_t len = 0;
  if (!net::parse_address(address, ss, len, err)) return false;

  int fd = ::socket(ss.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    err = std::string("socket_failed:") + std::strerror(errno);
    return false;
  }

  int yes = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
    log::warn("reuseaddr_failed", std::string("reason=") + std::strerror(errno));
  }

  if (::bind(fd, reinterpret_cast<const sockaddr*>(&ss), len) != 0) {
    err = std::string("bind_failed:") + std::strerror(errno);
    ::close(fd);
    return false;
  }
  if (::listen(fd, SOMAXCONN) != 0) {
    err = std::string("listen_failed:") + std::strerror(errno);
    ::close(fd);
    return false;
  }
  if (!net::set_nonblocking(fd, err) || !net::local_address(fd, local_, err)) {
    ::close(fd);
    return false;
  }

  fd_ = fd;
  return true;
}

void Acceptor::start() {
  stopping_.store(false);
  thread_ = std::thread([this] { run(); });
}

void Acceptor::stop() {
  stopping_.store(true);
  if (thread_.joinable()) thread_.join();
  if (fd_ >= 0) {
    if (::close(fd_) != 0) {
      log::debug("listener_close_failed", std::string("reason=") + std::strerror(errno));
    }
    fd_ = -1;
  }
}

// ---------------------------------------------------------------------------
// run()
// -----
// POLICY:
//   - Transient accept errors (client gave up mid-handshake, signal) retry.
//   - Any other error is fatal for this producer: close the channel.
//   - A peer we cannot make non-blocking is closed and skipped.
// ---------------------------------------------------------------------------
void Acceptor::run() {
  pollfd pfd{fd_, POLLIN, 0};

  while (!stopping_.load()) {
    const int pr = ::poll(&pfd, 1, POLL_SLICE_MS);
    if (pr == 0) continue;
    if (pr < 0) {
      if (errno == EINTR) continue;
      log::error("accept_failed", std::string("reason=") + std::strerror(errno));
      out_.close();
      return;
    }

    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    const int cfd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&ss), &len, SOCK_CLOEXEC);
    if (cfd < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ||
          errno == ECONNABORTED || errno == EPROTO) {
        continue;
      }
      log::error("accept_failed", std::string("reason=") + std::strerror(errno));
      out_.close();
      return;
    }

    std::string err;
    if (!net::set_nonblocking(cfd, err)) {
      log::warn("accept_skipped", "reason=" + err);
      ::close(cfd);
      continue;
    }

    const std::string remote = net::format_address(reinterpret_cast<const sockaddr*>(&ss), len);
    log::debug("accepted", "addr=" + remote);
    if (!out_.push(std::make_unique<transport::SocketConnection>(cfd, remote))) {
      return;                                       // consumer side is shutting down
    }
  }
}

} // namespace floodnet
