#pragma once
/**
 * @file connection.hpp
 * @brief Minimal duplex byte-stream interface the event loop drives.
 *
 * Everything the loop needs from a peer link and nothing more. The TCP
 * implementation lives in socket_connection.hpp; tests plug in an in-memory
 * double.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace floodnet::transport {

// Return codes kept flat so the loop can switch on them.
enum class ReadResult : uint8_t { Data=0, EndOfStream=1, WouldBlock=2, Error=3 };
enum class WriteResult : uint8_t { Ok=0, Error=1 };

/**
 * @brief Link trait every peer connection provides.
 *
 * Contract:
 *  - try_read(buf,cap,n) never blocks. Data sets n>0; EndOfStream means the
 *    remote closed (or we shut down); WouldBlock means try again later.
 *  - write(buf,len) never blocks. Bytes the link cannot take right now are
 *    kept and pushed out by later poll() calls. Error means the link is dead.
 *  - poll() does non-blocking service work (flush pending output).
 *  - wants_write() is true while output is pending.
 *  - shutdown() closes both directions; the next try_read reports EndOfStream.
 *  - native_handle() is a pollable fd, or -1 for links with none.
 *  - remote_address() is the peer's "ip:port" text, fixed at construction.
 */
class IConnection {
public:
  virtual ~IConnection() = default;
  virtual ReadResult  try_read(uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
  virtual WriteResult write(const uint8_t* data, std::size_t len) = 0;
  virtual WriteResult poll() = 0;
  virtual bool        wants_write() const = 0;
  virtual void        shutdown() = 0;
  virtual int         native_handle() const = 0;
  virtual const std::string& remote_address() const = 0;
};

} // namespace floodnet::transport
