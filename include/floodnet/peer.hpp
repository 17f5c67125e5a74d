#pragma once
/**
 * @file peer.hpp
 * @brief One live neighbour: its connection, its address, its partial frame.
 *
 * Peers are move-only. The Peer Set is a plain vector handed by value from
 * stage to stage of an event-loop iteration; whoever holds the vector owns
 * every connection in it.
 */

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "frame.hpp"
#include "transport/connection.hpp"

namespace floodnet {

struct Peer {
  std::unique_ptr<transport::IConnection> connection;
  std::string                             address;    ///< "ip:port", the origin key
  frame::assembler                        rx;         ///< bytes of the frame being received

  Peer() = default;
  explicit Peer(std::unique_ptr<transport::IConnection> conn)
  : connection(std::move(conn)),
    address(connection ? connection->remote_address() : std::string()) {}

  Peer(Peer&&) = default;
  Peer& operator=(Peer&&) = default;
};

using PeerSet = std::vector<Peer>;

} // namespace floodnet
