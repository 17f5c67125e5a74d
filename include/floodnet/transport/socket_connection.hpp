#pragma once
/**
 * @file socket_connection.hpp
 * @brief IConnection over a POSIX stream socket (TCP, or a socketpair in tests).
 *
 * Owns the fd and closes it on destruction. The fd must already be in
 * non-blocking mode; `dial()` and the acceptor take care of that.
 *
 * `dial()` never waits for the TCP handshake. The link starts out connecting:
 * reads report WouldBlock, writes are parked, and wants_write() stays true so
 * the event loop polls for POLLOUT. poll() completes the connect (or reports
 * its failure) without blocking.
 *
 * Writes go straight to `send(2)` with MSG_NOSIGNAL. Whatever the kernel does
 * not take immediately is parked in a bounded backlog and flushed by poll().
 * A peer that stops reading long enough to overflow the backlog is treated as
 * dead (WriteResult::Error).
 */

#include "connection.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace floodnet::transport {

class SocketConnection : public IConnection {
public:
  static constexpr std::size_t BACKLOG_CAP = 64 * 128;   ///< 64 frames of pending output

  /// Take ownership of a connected, non-blocking socket.
  SocketConnection(int fd, std::string remote_address);
  ~SocketConnection() override;

  SocketConnection(const SocketConnection&) = delete;
  SocketConnection& operator=(const SocketConnection&) = delete;

  /**
   * @brief Open an outbound TCP connection to "ip:port".
   *
   * Non-blocking: returns as soon as connect(2) is under way. Returns nullptr
   * and sets `err` only for failures known immediately (bad text, refused
   * on the spot); later failures come back from poll().
   */
  static std::unique_ptr<SocketConnection> dial(const std::string& address, std::string& err);

  ReadResult  try_read(uint8_t* out, std::size_t cap, std::size_t& out_len) override;
  WriteResult write(const uint8_t* data, std::size_t len) override;
  WriteResult poll() override;
  bool        wants_write() const override { return connecting_ || !backlog_.empty(); }
  void        shutdown() override;
  int         native_handle() const override { return fd_; }
  const std::string& remote_address() const override { return remote_; }

  std::size_t pending_bytes() const { return backlog_.size(); }

  /// True until the handshake of a dialed link is confirmed by poll().
  bool connecting() const { return connecting_; }

private:
  WriteResult flush();
  WriteResult finish_connect();

  int                  fd_{-1};
  std::string          remote_;
  std::vector<uint8_t> backlog_;
  bool                 connecting_{false};
  bool                 shut_down_{false};
};

} // namespace floodnet::transport
