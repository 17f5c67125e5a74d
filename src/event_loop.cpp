// -----------------------------------------------------------------------------
// event_loop.cpp: Implementation of the floodnet EventLoop
//
// API & iteration model:
//   see include/floodnet/event_loop.hpp
//
// Runnable scenarios:
//   see tests/test_event_loop.cpp
//
// NOTE: This file covers *how* each step is carried out, including the
// guard conditions that keep one bad peer from taking the node down.
// -----------------------------------------------------------------------------
#include "floodnet/event_loop.hpp"
#include "floodnet/log.hpp"
#include "floodnet/propagator.hpp"
#include "floodnet/transport/socket_connection.hpp"

#include <poll.h>
#include <cerrno>
#include <cstring>

namespace floodnet {

const char* status_name(LoopStatus status) {
  switch (status) {
    case LoopStatus::Running:              return "running";
    case LoopStatus::Stopped:              return "stopped";
    case LoopStatus::AcceptorDisconnected: return "acceptor_disconnected";
    case LoopStatus::CommandsDisconnected: return "commands_disconnected";
  }
  return "unknown";
}

std::unique_ptr<transport::IConnection> dial_tcp(const std::string& address, std::string& err) {
  return transport::SocketConnection::dial(address, err);
}

// ---------- public ----------

EventLoop::EventLoop(ConnectionChannel& accepts, CommandChannel& commands,
                     Connector connector, DeliverFn deliver)
: accepts_(accepts),
  commands_(commands),
  connector_(std::move(connector)),
  deliver_(std::move(deliver)) {}

void EventLoop::add_peer(std::unique_ptr<transport::IConnection> conn) {
  if (!conn) return;                          // nothing to adopt
  Peer peer(std::move(conn));
  log::info("new_peer", "addr=" + peer.address);
  peers_.push_back(std::move(peer));
}

bool EventLoop::connect(const std::string& address) {
  std::string err;
  std::unique_ptr<transport::IConnection> conn;
  if (connector_) conn = connector_(address, err);
  else            err  = "no_connector";

  if (!conn) {
    ++stats_.connect_failures;
    log::warn("connect_failed", "addr=" + address + " reason=" + err);
    return false;
  }
  log::info("dialed", "addr=" + address);         // handshake may still be in flight
  add_peer(std::move(conn));
  return true;
}

// run_once(): wait, then accept -> commands -> reads -> propagate.
LoopStatus EventLoop::run_once() {
  ++stats_.iterations;

  wait_ready();

  // 1. new inbound peers
  LoopStatus st = drain_accepts();
  if (st != LoopStatus::Running) return st;

  // 2. operator commands
  st = drain_commands();
  if (st != LoopStatus::Running) return st;

  // 3. one read per peer; the set is moved through and replaced
  Produced produced;
  peers_ = read_peers(std::move(peers_), produced);

  // 4. flood what step 3 accepted, each call sees drops from the previous one
  for (const auto& item : produced) {
    PropagateStats ps;
    peers_ = propagate(std::move(peers_), item.first, item.second, &ps);
    stats_.peers_dropped += ps.dropped;
  }

  return LoopStatus::Running;
}

LoopStatus EventLoop::run() {
  while (!stop_.load()) {
    const LoopStatus st = run_once();
    if (st != LoopStatus::Running) {
      log::error("loop_stopped", std::string("status=") + status_name(st));
      return st;
    }
  }
  log::info("loop_stopped", "status=stopped");
  return LoopStatus::Stopped;
}

// ---------- private: steps ----------

// -----------------------------------------------------------------------------
// wait_ready(): bounded readiness wait.
// PRE:   none; safe with an empty peer set.
// POLICY:
//   - Wake on either channel, any readable peer, or a peer with pending
//     output that became writable.
//   - Links with no fd (native_handle() < 0) cannot be waited on; the
//     timeout bounds how long they sit unread.
// NOTE:
//   - The result is not used for dispatch. Steps 1-4 run regardless.
// -----------------------------------------------------------------------------
void EventLoop::wait_ready() {
  if (poll_timeout_ms_ == 0) return;

  std::vector<pollfd> fds;
  fds.reserve(peers_.size() + 2);
  fds.push_back(pollfd{accepts_.wake_handle(), POLLIN, 0});
  fds.push_back(pollfd{commands_.wake_handle(), POLLIN, 0});

  bool unpollable = false;
  for (const auto& peer : peers_) {
    const int fd = peer.connection->native_handle();
    if (fd < 0) { unpollable = true; continue; }
    short events = POLLIN;
    if (peer.connection->wants_write()) events |= POLLOUT;
    fds.push_back(pollfd{fd, events, 0});
  }

  const int timeout = unpollable ? 0 : poll_timeout_ms_;
  if (::poll(fds.data(), fds.size(), timeout) < 0 && errno != EINTR) {
    log::warn("poll_failed", std::string("reason=") + std::strerror(errno));
  }
}

LoopStatus EventLoop::drain_accepts() {
  std::unique_ptr<transport::IConnection> conn;
  while (true) {
    switch (accepts_.try_pop(conn)) {
      case PopResult::Item:         add_peer(std::move(conn)); break;
      case PopResult::Empty:        return LoopStatus::Running;
      case PopResult::Disconnected: return LoopStatus::AcceptorDisconnected;
    }
  }
}

LoopStatus EventLoop::drain_commands() {
  Command cmd;
  while (true) {
    switch (commands_.try_pop(cmd)) {
      case PopResult::Item:         handle_command(cmd); break;
      case PopResult::Empty:        return LoopStatus::Running;
      case PopResult::Disconnected: return LoopStatus::CommandsDisconnected;
    }
  }
}

void EventLoop::handle_command(const Command& cmd) {
  switch (cmd.kind) {
    case Command::Kind::Connect:    connect(cmd.argument);   break;
    case Command::Kind::Broadcast:  broadcast(cmd.argument); break;
    case Command::Kind::Disconnect: disconnect_all();        break;
  }
}

// -----------------------------------------------------------------------------
// broadcast(): originate a message from operator text.
// POLICY:
//   - Rejected text costs only this request.
//   - Record in seen_ before flooding so an echo from a neighbour is
//     recognized as a duplicate.
//   - No origin: every current peer is written.
// -----------------------------------------------------------------------------
void EventLoop::broadcast(const std::string& text) {
  Message msg;
  const MessageStatus ms = Message::create(text, msg);
  if (ms != MessageStatus::Ok) {
    ++stats_.rejected_broadcasts;
    log::warn("broadcast_rejected", std::string("reason=") + status_name(ms) +
                                    " bytes=" + std::to_string(text.size()));
    return;
  }

  seen_.push(msg);
  log::info("broadcasting", "id=" + std::string(msg.id().to_hex_string().c_str()) +
                            " peers=" + std::to_string(peers_.size()));

  PropagateStats ps;
  peers_ = propagate(std::move(peers_), msg, std::nullopt, &ps);
  stats_.peers_dropped += ps.dropped;
}

// disconnect_all(): shut every link; removal happens on the next EOF read.
void EventLoop::disconnect_all() {
  for (auto& peer : peers_) {
    peer.connection->shutdown();
  }
  log::info("disconnect", "peers=" + std::to_string(peers_.size()));
}

PeerSet EventLoop::read_peers(PeerSet peers, Produced& produced) {
  PeerSet kept;
  kept.reserve(peers.size());
  for (auto& peer : peers) {
    if (read_peer(peer, produced)) {
      kept.push_back(std::move(peer));
    } else {
      ++stats_.peers_dropped;
    }
  }
  return kept;
}

// -----------------------------------------------------------------------------
// read_peer(): service output, then one non-blocking read.
// PRE:   peer.connection is non-null.
// POLICY:
//   - Read at most the bytes missing from the current frame, never past it.
//   - Decode failure drops the frame only.
//   - Already-seen message: no delivery, no propagation.
// OUT:
//   - New message: pushed to seen_, delivered, appended to `produced`.
// -----------------------------------------------------------------------------
bool EventLoop::read_peer(Peer& peer, Produced& produced) {
  transport::IConnection& conn = *peer.connection;

  if (conn.poll() != transport::WriteResult::Ok) {
    log::warn("write_failed", "addr=" + peer.address + " action=drop_peer");
    return false;
  }

  size_t n = 0;
  switch (conn.try_read(peer.rx.write_ptr(), peer.rx.missing(), n)) {
    case transport::ReadResult::WouldBlock:
      return true;
    case transport::ReadResult::EndOfStream:
      log::info("peer_disconnected", "addr=" + peer.address);
      return false;
    case transport::ReadResult::Error:
      log::warn("read_failed", "addr=" + peer.address + " action=drop_peer");
      return false;
    case transport::ReadResult::Data:
      break;
  }

  peer.rx.commit(n);
  if (!peer.rx.complete()) return true;       // partial frame, wait for more

  Message msg;
  const frame::FrameStatus fs = frame::decode(peer.rx.frame(), msg);
  peer.rx.reset();

  if (fs != frame::FrameStatus::Ok) {
    ++stats_.rejected_frames;
    log::warn("frame_rejected", "addr=" + peer.address + " reason=" + frame::status_name(fs));
    return true;
  }

  if (seen_.contains(msg)) {
    ++stats_.duplicates;
    log::debug("duplicate", "addr=" + peer.address +
                            " id=" + std::string(msg.id().to_hex_string().c_str()));
    return true;
  }

  seen_.push(msg);
  ++stats_.delivered;
  if (deliver_) deliver_(peer.address, msg);
  produced.emplace_back(msg, peer.address);
  return true;
}

} // namespace floodnet
