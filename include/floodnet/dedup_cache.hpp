#pragma once
/**
 * @file dedup_cache.hpp
 * @brief Fixed-capacity FIFO "seen" set used to suppress re-flooding.
 *
 * Remembers the last N items in insertion order. When full, a push evicts the
 * oldest entry and hands it back. Membership tests never reorder entries:
 * seeing a message again does not keep it alive longer. That keeps eviction
 * strictly by age of first sight.
 *
 * Header-only on purpose; the ring is an etl::deque so the whole cache lives
 * inline in its owner with no heap traffic.
 */

#include <cstddef>
#include <optional>

#include "etl/deque.h"
#include "message.hpp"

namespace floodnet {

template <typename T, std::size_t N>
class DedupCache {
  static_assert(N > 0, "DedupCache needs room for at least one entry");

public:
  static constexpr std::size_t CAPACITY = N;

  /**
   * @brief Insert `item`; return the evicted oldest entry if the ring was full.
   *
   * An item already present is left where it is: no second copy, no
   * eviction, no refresh of its age. Size only grows on new entries.
   */
  std::optional<T> push(const T& item) {
    std::optional<T> evicted;
    if (contains(item)) return evicted;
    if (ring_.full()) {                 // make room: oldest out first
      evicted = ring_.front();
      ring_.pop_front();
    }
    ring_.push_back(item);
    return evicted;
  }

  /// Pure membership check by equality. Linear scan; N is small.
  bool contains(const T& item) const {
    for (const auto& seen : ring_) {
      if (seen == item) return true;
    }
    return false;
  }

  std::size_t size() const     { return ring_.size(); }
  std::size_t capacity() const { return N; }
  bool        empty() const    { return ring_.empty(); }
  void        clear()          { ring_.clear(); }

  /// Oldest entry first. Precondition: !empty().
  const T& oldest() const { return ring_.front(); }

private:
  etl::deque<T, N> ring_;
};

static constexpr std::size_t DEDUP_CAP = 16;   ///< Messages remembered per node

using MessageCache = DedupCache<Message, DEDUP_CAP>;

} // namespace floodnet
