/**
 * @file event_loop.hpp
 * @brief floodnet EventLoop: the single-threaded node brain.
 *
 * @details
 * ## Field Brief
 * The loop owns the two pieces of state a flooding node needs: the live
 * **Peer Set** and the **Dedup Cache**. Nobody else touches them, so nothing
 * here takes a lock. Producers on other threads (the acceptor, the stdin
 * reader) only ever talk to it through channels.
 *
 * ---
 *
 * @par Operational Model (one iteration)
 * ```
 *   wait ── poll(2) over channel wake fds + peer fds, bounded by poll_timeout
 *    │
 *   1. accepts   ── drain ConnectionChannel, every connection joins the set
 *    │
 *   2. commands  ── drain CommandChannel
 *    │               connect    -> dial, join on success, log on failure
 *    │               broadcast  -> new Message, seen.push, propagate(no origin)
 *    │               disconnect -> shutdown() every peer, set kept as-is
 *    │
 *   3. reads     ── one non-blocking read per peer
 *    │               EOF / error -> peer dropped
 *    │               full frame  -> decode, dedup, deliver, queue (msg, addr)
 *    │
 *   4. propagate ── fold propagate() over the queued pairs, threading the set
 * ```
 *
 * The wait only shortens idle time. Steps 1-4 always run, in that order, on
 * every iteration whether or not poll(2) reported anything.
 *
 * ---
 *
 * @par Failure Model
 * - **Broadcast too large / contains 0x00:** that request is rejected and
 *   logged. Nothing else is affected.
 * - **Dial failure:** logged, the loop carries on. Dials never block: a
 *   handshake still in flight joins the set as a pending peer and is
 *   completed (or dropped) by the normal per-peer service in step 3.
 * - **Malformed frame:** the frame is dropped, the peer stays.
 * - **Read or write error on a peer:** only that peer is dropped.
 * - **Producer channel closed:** fatal. run_once() returns
 *   `AcceptorDisconnected` or `CommandsDisconnected` and the caller exits.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * floodnet::ConnectionChannel accepts;
 * floodnet::CommandChannel    commands;
 * floodnet::EventLoop loop(accepts, commands, floodnet::dial_tcp,
 *     [](const std::string& addr, const floodnet::Message& m) {
 *       std::cout << addr << ": " << m.display_text() << "\n";
 *     });
 * floodnet::LoopStatus st = loop.run();   // until stop or producer death
 * @endcode
 */
#ifndef FLOODNET_EVENT_LOOP_HPP
#define FLOODNET_EVENT_LOOP_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <stdint.h>

#include "acceptor.hpp"
#include "command_source.hpp"
#include "dedup_cache.hpp"
#include "message.hpp"
#include "peer.hpp"
#include "transport/connection.hpp"

namespace floodnet {

/// Why run_once()/run() returned.
enum class LoopStatus : uint8_t {
  Running = 0,            ///< iteration done, keep going
  Stopped,                ///< request_stop() honoured
  AcceptorDisconnected,   ///< accept producer died
  CommandsDisconnected,   ///< command producer died
};

const char* status_name(LoopStatus status);

/**
 * @brief Opens an outbound connection. nullptr + `err` on failure.
 *
 * The node uses dial_tcp(); tests substitute in-memory links.
 */
using Connector = std::function<std::unique_ptr<transport::IConnection>(const std::string& address,
                                                                        std::string& err)>;

/// Called once per newly seen message received from a peer.
using DeliverFn = std::function<void(const std::string& origin, const Message& msg)>;

/// Connector backed by transport::SocketConnection::dial().
std::unique_ptr<transport::IConnection> dial_tcp(const std::string& address, std::string& err);

/// Running counters. Monotonic for the life of the loop.
struct LoopStats {
  uint64_t iterations{0};
  uint64_t delivered{0};             ///< new messages received from peers
  uint64_t duplicates{0};            ///< frames whose message was already seen
  uint64_t rejected_frames{0};       ///< frames that failed to decode
  uint64_t rejected_broadcasts{0};   ///< broadcast requests refused
  uint64_t connect_failures{0};
  uint64_t peers_dropped{0};         ///< EOF, read error or write error
};

class EventLoop {
public:
  static constexpr int POLL_TIMEOUT_DEFAULT_MS = 100;   ///< idle wait per iteration

  EventLoop(ConnectionChannel& accepts, CommandChannel& commands,
            Connector connector, DeliverFn deliver);

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  /// Upper bound on the readiness wait. 0 means never wait.
  void set_poll_timeout_ms(int ms) { poll_timeout_ms_ = ms < 0 ? 0 : ms; }
  int  poll_timeout_ms() const     { return poll_timeout_ms_; }

  /// Adopt an established connection into the Peer Set.
  void add_peer(std::unique_ptr<transport::IConnection> conn);

  /**
   * @brief Dial `address` through the connector and adopt the result.
   *
   * Used for `connect` commands and for bootstrap peers at start-up.
   * @retval false dial failed; already logged and counted.
   */
  bool connect(const std::string& address);

  /// Wait (bounded), then run steps 1-4 once.
  LoopStatus run_once();

  /// run_once() until it reports anything but Running, or until stopped.
  LoopStatus run();

  /// Safe from a signal handler or another thread.
  void request_stop() { stop_.store(true); }

  const PeerSet&      peers() const { return peers_; }
  const MessageCache& seen()  const { return seen_; }
  const LoopStats&    stats() const { return stats_; }

private:
  /// A message accepted in step 3 and the address it came from.
  using Produced = std::vector<std::pair<Message, std::string>>;

  void       wait_ready();
  LoopStatus drain_accepts();
  LoopStatus drain_commands();
  void       handle_command(const Command& cmd);
  void       broadcast(const std::string& text);
  void       disconnect_all();
  PeerSet    read_peers(PeerSet peers, Produced& produced);

  /// One read on one peer. False if the peer must be dropped.
  bool       read_peer(Peer& peer, Produced& produced);

  ConnectionChannel& accepts_;
  CommandChannel&    commands_;
  Connector          connector_;
  DeliverFn          deliver_;

  PeerSet            peers_;
  MessageCache       seen_;
  LoopStats          stats_;
  int                poll_timeout_ms_{POLL_TIMEOUT_DEFAULT_MS};
  std::atomic<bool>  stop_{false};
};

} // namespace floodnet

#endif // FLOODNET_EVENT_LOOP_HPP
