// -----------------------------------------------------------------------------
// propagator.cpp: flood fan-out
//
// API contract: see include/floodnet/propagator.hpp
// -----------------------------------------------------------------------------
#include "floodnet/propagator.hpp"
#include "floodnet/log.hpp"

namespace floodnet {

PeerSet propagate(PeerSet peers, const Message& msg,
                  const std::optional<std::string>& origin,
                  PropagateStats* stats) {
  PropagateStats local;
  PropagateStats& st = stats ? *stats : local;

  // PRE: partition first so origin peers are never candidates for writing
  PeerSet held_back;
  PeerSet rest;
  rest.reserve(peers.size());
  for (auto& peer : peers) {
    if (origin && peer.address == *origin) {
      held_back.push_back(std::move(peer));
      ++st.skipped_origin;
    } else {
      rest.push_back(std::move(peer));
    }
  }
  peers.clear();

  frame::Frame block;
  const frame::FrameStatus fs = frame::encode(msg, block);
  if (fs != frame::FrameStatus::Ok) {
    // Nothing to send; keep everyone.
    log::warn("propagate_skipped", std::string("reason=") + frame::status_name(fs));
    for (auto& peer : held_back) rest.push_back(std::move(peer));
    return rest;
  }

  log::debug("propagate", "id=" + std::string(msg.id().to_hex_string().c_str()) +
                          " targets=" + std::to_string(rest.size()));

  // FAN-OUT: independent writes, failures only cost the failing peer
  PeerSet out;
  out.reserve(rest.size() + held_back.size());
  for (auto& peer : rest) {
    if (peer.connection->write(block.data(), block.size()) == transport::WriteResult::Ok) {
      ++st.written;
      out.push_back(std::move(peer));
    } else {
      ++st.dropped;
      log::warn("write_failed", "addr=" + peer.address + " action=drop_peer");
    }
  }

  // OUT: origin peers re-join after the written ones
  for (auto& peer : held_back) out.push_back(std::move(peer));
  return out;
}

} // namespace floodnet
