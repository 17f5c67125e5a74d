/**
 * @file message.hpp
 * @brief floodnet Message: bounded text content plus its 16-byte identity.
 *
 * A `Message` is the unit the mesh floods. It holds:
 *  - **content**: the text an operator broadcast, stored byte-exact;
 *  - **id**: the MessageID stamped once at the originating node.
 *
 * ### Size rule
 * A message must fit one wire frame together with its separator and id:
 *
 *     content.size() + 1 + MessageID::SIZE <= FRAME_CAPACITY   (128)
 *
 * so content is capped at `CONTENT_MAX` = 111 bytes. Content may not contain
 * a `0x00` byte, because the first zero in a frame marks where content ends.
 *
 * ### Common construction paths
 * - Local broadcast: `Message::create(text, msg)` stamps a fresh id.
 * - Wire decode: `Message::create(text, id, msg)` keeps the received id.
 *
 * Messages are immutable once built and compare by full equality (content
 * and id), which is what the dedup cache keys on.
 *
 * Content received from the wire is kept verbatim even if it is not valid
 * UTF-8, so forwarding re-emits the exact bytes that arrived. Use
 * `display_text()` for anything a human will read.
 */
#ifndef FLOODNET_MESSAGE_HPP
#define FLOODNET_MESSAGE_HPP

#include "etl/string.h"
#include "message_id.hpp"

#include <string>
#include <stdint.h>
#include <stddef.h>

namespace floodnet {

/// Result codes for constructing a Message.
enum class MessageStatus : uint8_t {
  Ok = 0,
  TooLarge,            // content + separator + id would not fit one frame
  ContainsSeparator,   // content holds a 0x00 byte
};

class Message {
public:
  static constexpr size_t FRAME_CAPACITY = 128;                                   ///< Bytes per wire frame
  static constexpr size_t CONTENT_MAX    = FRAME_CAPACITY - 1 - MessageID::SIZE;  ///< 111 content bytes

  using ContentStr = etl::string<CONTENT_MAX>;

  /// Default: empty content, nil id. Only useful as an out-parameter target.
  Message() = default;

  /// Validate `text` and stamp a freshly generated id.
  static MessageStatus create(const std::string& text, Message& out);

  /// Validate `text` and keep the given id (decode path, tests).
  static MessageStatus create(const std::string& text, const MessageID& id, Message& out);

  const ContentStr& content() const { return content_; }
  const MessageID&  id()      const { return id_; }

  /// Content with invalid UTF-8 sequences replaced by U+FFFD.
  std::string display_text() const;

  bool operator==(const Message& other) const {
    return id_ == other.id_ && content_ == other.content_;
  }
  bool operator!=(const Message& other) const { return !(*this == other); }

private:
  ContentStr content_{};
  MessageID  id_{};
};

/// Short stable name for logs ("ok", "too_large", "contains_separator").
const char* status_name(MessageStatus status);

} // namespace floodnet

#endif // FLOODNET_MESSAGE_HPP
