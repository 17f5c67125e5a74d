// ============================================================================
// socket_connection.cpp: implementation for transport/socket_connection.hpp
// For the contract see transport/connection.hpp. For usage, check tests/.
// ============================================================================

#include "floodnet/transport/socket_connection.hpp"
#include "floodnet/log.hpp"
#include "floodnet/net_address.hpp"

#include <sys/socket.h>    // send, recv, shutdown, connect
#include <poll.h>          // connect completion check
#include <unistd.h>        // close
#include <cerrno>
#include <cstring>         // strerror
#include <utility>

namespace floodnet::transport {

SocketConnection::SocketConnection(int fd, std::string remote_address)
: fd_(fd), remote_(std::move(remote_address)) {
  backlog_.reserve(128);
}

SocketConnection::~SocketConnection() {
  if (fd_ >= 0) {
    if (::close(fd_) != 0) {
      log::debug("close_failed", "addr=" + remote_ + " reason=" + std::strerror(errno));
    }
  }
}

// ---------------------------------------------------------------------------
// dial()
// ------
// Parse, create a non-blocking socket, start connect(2) and return at once.
//
// Returns: owning pointer, or nullptr with `err` set:
//   bad_address / bad_port    unparsable text
//   connect_failed:<why>      socket(2) failed or connect(2) was refused outright
//
// NOTE:
//   - EINPROGRESS (and EINTR, after which the kernel keeps connecting) gives a
//     link in the connecting state. poll() finishes it once the socket turns
//     writable; a late failure surfaces there as WriteResult::Error.
//   - remote_address() is the dialed target in canonical "ip:port" form, the
//     same text getpeername(2) yields once connected.
// ---------------------------------------------------------------------------
std::unique_ptr<SocketConnection> SocketConnection::dial(const std::string& address,
                                                         std::string& err) {
  sockaddr_storage ss{};
  socklen_t len = 0;
  if (!net::parse_address(address, ss, len, err)) return nullptr;

  int fd = ::socket(ss.ss_family, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (fd < 0) {
    err = std::string("connect_failed:") + std::strerror(errno);
    return nullptr;
  }

  bool pending = false;
  if (::connect(fd, reinterpret_cast<const sockaddr*>(&ss), len) != 0) {
    if (errno != EINPROGRESS && errno != EINTR) {
      err = std::string("connect_failed:") + std::strerror(errno);
      ::close(fd);                    // nothing useful to report past the connect error
      return nullptr;
    }
    pending = true;
  }

  auto conn = std::make_unique<SocketConnection>(
      fd, net::format_address(reinterpret_cast<const sockaddr*>(&ss), len));
  conn->connecting_ = pending;
  return conn;
}

// ---------------------------------------------------------------------------
// finish_connect()
// Zero-timeout check on a pending connect. Ok while still in flight, Ok once
// established (connecting_ cleared), Error if the kernel reports a failure.
// ---------------------------------------------------------------------------
WriteResult SocketConnection::finish_connect() {
  pollfd pfd{fd_, POLLOUT, 0};
  const int pr = ::poll(&pfd, 1, 0);
  if (pr < 0) {
    if (errno == EINTR) return WriteResult::Ok;
    log::warn("connect_failed", "addr=" + remote_ + " reason=" + std::strerror(errno));
    return WriteResult::Error;
  }
  if (pr == 0) return WriteResult::Ok;          // SYN still in flight

  int so_error = 0;
  socklen_t so_len = sizeof(so_error);
  if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0) {
    so_error = errno;
  }
  if (so_error != 0) {
    log::warn("connect_failed", "addr=" + remote_ + " reason=" + std::strerror(so_error));
    return WriteResult::Error;
  }

  connecting_ = false;
  log::debug("connect_established", "addr=" + remote_);
  return WriteResult::Ok;
}

// ---------------------------------------------------------------------------
// try_read()
// One recv(2). EINTR is folded into WouldBlock: the loop comes back next pass.
// ---------------------------------------------------------------------------
ReadResult SocketConnection::try_read(uint8_t* out, std::size_t cap, std::size_t& out_len) {
  out_len = 0;
  if (fd_ < 0) return ReadResult::Error;
  if (connecting_) return shut_down_ ? ReadResult::EndOfStream : ReadResult::WouldBlock;

  const ssize_t n = ::recv(fd_, out, cap, 0);
  if (n > 0) {
    out_len = static_cast<std::size_t>(n);
    return ReadResult::Data;
  }
  if (n == 0) return ReadResult::EndOfStream;
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return ReadResult::WouldBlock;
  return ReadResult::Error;
}

// ---------------------------------------------------------------------------
// write()
// -------
// POLICY:
//   - Preserve byte order: if anything is already parked, park behind it.
//   - Otherwise send directly and park only the unsent tail.
//   - While the connect is in flight everything is parked.
//   - Backlog overflow = dead peer.
// ---------------------------------------------------------------------------
WriteResult SocketConnection::write(const uint8_t* data, std::size_t len) {
  if (fd_ < 0) return WriteResult::Error;

  if (backlog_.size() + len > BACKLOG_CAP) {
    log::warn("backlog_overflow", "addr=" + remote_ + " pending=" + std::to_string(backlog_.size()));
    return WriteResult::Error;
  }

  backlog_.insert(backlog_.end(), data, data + len);
  if (connecting_) return WriteResult::Ok;
  return flush();
}

WriteResult SocketConnection::poll() {
  if (connecting_) {
    if (finish_connect() != WriteResult::Ok) return WriteResult::Error;
    if (connecting_) return WriteResult::Ok;
  }
  if (backlog_.empty()) return WriteResult::Ok;
  return flush();
}

// flush(): push as much of backlog_ as the socket takes right now.
WriteResult SocketConnection::flush() {
  std::size_t sent = 0;
  while (sent < backlog_.size()) {
    const ssize_t n = ::send(fd_, backlog_.data() + sent, backlog_.size() - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;   // kernel buffer full

    backlog_.erase(backlog_.begin(), backlog_.begin() + static_cast<std::ptrdiff_t>(sent));
    log::debug("send_failed", "addr=" + remote_ + " reason=" + std::strerror(errno));
    return WriteResult::Error;
  }
  backlog_.erase(backlog_.begin(), backlog_.begin() + static_cast<std::ptrdiff_t>(sent));
  return WriteResult::Ok;
}

// shutdown(): both directions. The fd stays open until destruction so the
// next recv(2) reports end-of-stream and the loop drops us normally.
void SocketConnection::shutdown() {
  if (fd_ < 0) return;
  shut_down_ = true;                             // a link still connecting reads EOF from now on
  if (::shutdown(fd_, SHUT_RDWR) != 0 && errno != ENOTCONN) {
    log::debug("shutdown_failed", "addr=" + remote_ + " reason=" + std::strerror(errno));
  }
}

} // namespace floodnet::transport
