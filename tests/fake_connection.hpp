#pragma once
// In-memory IConnection for propagator and event-loop tests.
//
// The test keeps a FakeLink (shared state) and hands the FakeConnection to
// the code under test, so it can still inspect writes and feed reads after
// ownership has moved into a Peer Set.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "floodnet/frame.hpp"
#include "floodnet/transport/connection.hpp"

namespace floodnet::test {

struct FakeLink {
  std::string               address;
  std::deque<std::vector<uint8_t>> inbound;   // chunks returned by try_read, in order
  std::vector<uint8_t>      written;          // every byte written
  bool eof_after_inbound{false};              // report EndOfStream once inbound drains
  bool fail_reads{false};
  bool fail_writes{false};
  bool shut_down{false};
  bool destroyed{false};
  int  reads{0};

  void feed(const frame::Frame& f) { inbound.emplace_back(f.begin(), f.end()); }
  void feed(const std::vector<uint8_t>& bytes) { inbound.push_back(bytes); }

  size_t frames_written() const { return written.size() / frame::CAPACITY; }

  frame::Frame written_frame(size_t i) const {
    frame::Frame f{};
    std::memcpy(f.data(), written.data() + i * frame::CAPACITY, frame::CAPACITY);
    return f;
  }
};

class FakeConnection : public transport::IConnection {
public:
  explicit FakeConnection(std::shared_ptr<FakeLink> link) : link_(std::move(link)) {}
  ~FakeConnection() override { link_->destroyed = true; }

  transport::ReadResult try_read(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
    ++link_->reads;
    out_len = 0;
    if (link_->fail_reads) return transport::ReadResult::Error;
    if (link_->shut_down)  return transport::ReadResult::EndOfStream;
    if (link_->inbound.empty()) {
      return link_->eof_after_inbound ? transport::ReadResult::EndOfStream
                                      : transport::ReadResult::WouldBlock;
    }
    auto& chunk = link_->inbound.front();
    const size_t n = chunk.size() < cap ? chunk.size() : cap;
    std::memcpy(out, chunk.data(), n);
    chunk.erase(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
    if (chunk.empty()) link_->inbound.pop_front();
    out_len = n;
    return transport::ReadResult::Data;
  }

  transport::WriteResult write(const uint8_t* data, std::size_t len) override {
    if (link_->fail_writes || link_->shut_down) return transport::WriteResult::Error;
    link_->written.insert(link_->written.end(), data, data + len);
    return transport::WriteResult::Ok;
  }

  transport::WriteResult poll() override { return transport::WriteResult::Ok; }
  bool wants_write() const override { return false; }
  void shutdown() override { link_->shut_down = true; }
  int  native_handle() const override { return -1; }
  const std::string& remote_address() const override { return link_->address; }

private:
  std::shared_ptr<FakeLink> link_;
};

inline std::shared_ptr<FakeLink> make_link(const std::string& address) {
  auto link = std::make_shared<FakeLink>();
  link->address = address;
  return link;
}

inline std::unique_ptr<transport::IConnection> make_conn(const std::shared_ptr<FakeLink>& link) {
  return std::make_unique<FakeConnection>(link);
}

} // namespace floodnet::test
