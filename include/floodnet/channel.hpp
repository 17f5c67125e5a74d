#pragma once
/**
 * @file channel.hpp
 * @brief Producer-to-loop handoff queue with a disconnect signal and a wake fd.
 *
 * The acceptor and the stdin reader block in their own threads and hand their
 * results to the event loop through a Channel. The loop never blocks on it:
 * it drains with try_pop() once per iteration and includes wake_handle() in
 * its poll(2) set, so a push wakes an idle loop right away.
 *
 * Semantics mirror a classic mpsc receiver:
 *  - try_pop() returns Item while anything is queued, even after close();
 *  - Empty when nothing is queued and the producer is alive;
 *  - Disconnected when nothing is queued and the producer closed the channel.
 *
 * The wake fd is an eventfd. It is readable while items are queued or the
 * channel is closed and goes quiet once the queue is drained.
 */

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>

#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>

#include "log.hpp"

namespace floodnet {

enum class PopResult : uint8_t { Item=0, Empty=1, Disconnected=2 };

template <typename T>
class Channel {
public:
  /// Throws std::system_error if the eventfd cannot be created.
  Channel() {
    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
      throw std::system_error(errno, std::generic_category(), "eventfd");
    }
  }

  ~Channel() {
    if (wake_fd_ >= 0 && ::close(wake_fd_) != 0) {
      log::debug("channel_close_failed", std::string("reason=") + std::to_string(errno));
    }
  }

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  /// Queue an item. Returns false (and drops it) once the channel is closed.
  bool push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) return false;
    queue_.push_back(std::move(item));
    signal();
    return true;
  }

  PopResult try_pop(T& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!queue_.empty()) {
      out = std::move(queue_.front());
      queue_.pop_front();
      if (queue_.empty() && !closed_) drain_wake();
      return PopResult::Item;
    }
    if (closed_) return PopResult::Disconnected;
    drain_wake();
    return PopResult::Empty;
  }

  /// Producer is gone. Queued items remain poppable.
  void close() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) return;
    closed_ = true;
    signal();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  int wake_handle() const { return wake_fd_; }

private:
  // Both helpers run under mtx_.
  void signal() {
    const uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
      log::warn("channel_wake_failed", std::string("reason=") + std::to_string(errno));
    }
  }

  void drain_wake() {
    uint64_t count = 0;
    if (::read(wake_fd_, &count, sizeof(count)) < 0 && errno != EAGAIN) {
      log::warn("channel_drain_failed", std::string("reason=") + std::to_string(errno));
    }
  }

  mutable std::mutex mtx_;
  std::deque<T>      queue_;
  bool               closed_{false};
  int                wake_fd_{-1};
};

} // namespace floodnet
