#pragma once

/**
 * @file frame.hpp
 * @brief Fixed 128-byte wire frame: encode/decode of one Message per block.
 *
 * @details
 * OVERVIEW
 * --------
 * Every message crosses a peer link as exactly one 128-byte block. There is no
 * length prefix and no escape scheme; the block size itself is the boundary.
 *
 *   offset 0            content bytes (0..111, no 0x00 inside)
 *   offset len          0x00 separator
 *   offset len+1        16-byte MessageID
 *   offset len+17..127  zero padding
 *
 * Encoding rules:
 *   - The frame is zero-filled, content copied, separator written, id copied.
 *   - A message whose content does not fit is refused with MessageTooLarge.
 *     No partial or truncated frame is ever produced.
 *
 * Decoding rules:
 *   - The first 0x00 in the block ends the content. No zero at all is
 *     MissingSeparator.
 *   - Fewer than 16 bytes after the separator is CorruptId. The id bytes
 *     themselves are never judged; the nil id round-trips like any other.
 *   - Padding after the id is not inspected.
 *   - Content bytes are taken verbatim. Invalid UTF-8 is not an error here.
 *
 * STREAM REASSEMBLY
 * -----------------
 * A non-blocking read may return only part of a block. `frame::assembler`
 * keeps the bytes received so far for one peer and reports when the block is
 * complete. Callers read at most `missing()` bytes so a read never spills
 * into the next frame.
 *
 * EXAMPLE
 * -------
 * @code
 *   floodnet::Message msg;
 *   floodnet::Message::create("hello", msg);
 *   floodnet::frame::Frame block;
 *   if (floodnet::frame::encode(msg, block) == floodnet::frame::FrameStatus::Ok) {
 *       // block[0..4] = "hello", block[5] = 0x00, block[6..21] = id, rest zero
 *   }
 * @endcode
 */

#include "etl/array.h"
#include "message.hpp"

#include <stddef.h>
#include <stdint.h>

namespace floodnet {
namespace frame {

static constexpr size_t CAPACITY = Message::FRAME_CAPACITY;   ///< 128

using Frame = etl::array<uint8_t, CAPACITY>;

enum class FrameStatus : uint8_t {
  Ok = 0,
  MessageTooLarge,    // encode: content + separator + id exceed CAPACITY
  MissingSeparator,   // decode: no 0x00 anywhere in the block
  CorruptId,          // decode: id truncated by the block end
};

/// Serialize `msg` into `out`. `out` is fully overwritten on success.
FrameStatus encode(const Message& msg, Frame& out);

/// Parse one complete block into `out`. `out` is untouched on failure.
FrameStatus decode(const Frame& in, Message& out);

/// Short stable name for logs ("ok", "message_too_large", ...).
const char* status_name(FrameStatus status);

/**
 * @brief Accumulates one frame from a byte stream.
 *
 * Usage per read:
 *   n = read(asm.write_ptr(), asm.missing());
 *   asm.commit(n);
 *   if (asm.complete()) { decode(asm.frame(), msg); asm.reset(); }
 */
class assembler {
public:
  uint8_t* write_ptr()        { return buf_.data() + len_; }
  size_t   missing()   const  { return CAPACITY - len_; }
  size_t   buffered()  const  { return len_; }
  bool     complete()  const  { return len_ == CAPACITY; }

  /// Record `n` freshly written bytes; clamps at CAPACITY.
  void commit(size_t n) {
    len_ = (n > missing()) ? CAPACITY : len_ + n;
  }

  const Frame& frame() const { return buf_; }
  void reset() { len_ = 0; }

private:
  Frame  buf_{};
  size_t len_{0};
};

} // namespace frame
} // namespace floodnet
