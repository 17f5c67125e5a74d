#pragma once
/**
 * @file propagator.hpp
 * @brief Flood one message to every peer except the one it came from.
 *
 * Contract:
 *   propagate(peers, msg, origin) -> peers'
 *
 *  1. Split `peers` into those whose address equals `origin` (held back,
 *     never written) and the rest.
 *  2. Encode `msg` once. Write the frame to each of the rest independently.
 *     A peer whose write fails is dropped; the others are unaffected.
 *  3. Return the surviving written peers followed by the held-back ones,
 *     both groups in their original relative order.
 *
 * With no origin (local broadcast) every peer is written. The function owns
 * the set for the duration of the call; dropped peers are destroyed here.
 */

#include <cstdint>
#include <optional>
#include <string>

#include "message.hpp"
#include "peer.hpp"

namespace floodnet {

/// Per-call tallies, for logs and tests.
struct PropagateStats {
  uint32_t written{0};
  uint32_t skipped_origin{0};
  uint32_t dropped{0};
};

PeerSet propagate(PeerSet peers, const Message& msg,
                  const std::optional<std::string>& origin,
                  PropagateStats* stats = nullptr);

} // namespace floodnet
