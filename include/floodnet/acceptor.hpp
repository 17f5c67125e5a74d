#pragma once
/**
 * @file acceptor.hpp
 * @brief Listening socket plus the thread that accepts inbound peers.
 *
 * listen() binds "ip:port" (port 0 picks a free one; see local_address()).
 * start() spawns the accept thread, which hands every new connection,
 * already non-blocking and wrapped as a SocketConnection, to the event loop
 * through a ConnectionChannel.
 *
 * A fatal accept error (anything but the usual transient ones) closes the
 * channel. The loop reports that as AcceptorDisconnected and stops.
 */

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "channel.hpp"
#include "transport/connection.hpp"

namespace floodnet {

using ConnectionChannel = Channel<std::unique_ptr<transport::IConnection>>;

class Acceptor {
public:
  static constexpr int POLL_SLICE_MS = 100;   ///< how often the thread checks for stop()

  explicit Acceptor(ConnectionChannel& out);
  ~Acceptor();

  Acceptor(const Acceptor&) = delete;
  Acceptor& operator=(const Acceptor&) = delete;

  /// Bind and listen. False + `err` on failure (bad_address, bind_failed:<why>, ...).
  bool listen(const std::string& address, std::string& err);

  /// Bound "ip:port", valid after a successful listen().
  const std::string& local_address() const { return local_; }

  void start();

  /// Stop the thread and close the listening socket. Does not close the channel.
  void stop();

private:
  void run();

  ConnectionChannel& out_;
  int                fd_{-1};
  std::string        local_;
  std::thread        thread_;
  std::atomic<bool>  stopping_{false};
};

} // namespace floodnet
