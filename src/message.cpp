/**
 * @file message.cpp
 * @brief Implementation of the floodnet Message class.
 *
 * Refer to `message.hpp` for the size rule and construction paths.
 */
#include "floodnet/message.hpp"

namespace floodnet {

// --- create(): local broadcast path, stamps a new id
MessageStatus Message::create(const std::string& text, Message& out) {
  return create(text, MessageID::generate(), out);
}

// --- create(): validate size and separator, then fill `out`
MessageStatus Message::create(const std::string& text, const MessageID& id, Message& out) {
  // Size rule first: the frame must hold content, one separator and the id
  if (text.size() > CONTENT_MAX) {
    return MessageStatus::TooLarge;
  }

  // A zero byte would end the content early on decode
  if (text.find('\0') != std::string::npos) {
    return MessageStatus::ContainsSeparator;
  }

  out.content_.assign(text.data(), text.size());
  out.id_ = id;
  return MessageStatus::Ok;
}

// -----------------------------------------------------------------------------
// display_text(): lossy UTF-8 rendering.
// POLICY:
//   - Well-formed sequences (RFC 3629: no overlongs, no surrogates, <= U+10FFFF)
//     are copied through.
//   - Each maximal invalid prefix becomes one U+FFFD (EF BF BD).
// NOTE:
//   - content_ itself is never modified; forwarding uses the raw bytes.
// -----------------------------------------------------------------------------
std::string Message::display_text() const {
  static const char REPLACEMENT[] = "\xEF\xBF\xBD";

  std::string out;
  out.reserve(content_.size());

  const size_t n = content_.size();
  size_t i = 0;
  while (i < n) {
    const uint8_t b0 = static_cast<uint8_t>(content_[i]);

    // ASCII fast path
    if (b0 < 0x80) {
      out += static_cast<char>(b0);
      ++i;
      continue;
    }

    // Decide expected length and the allowed range of the second byte
    size_t  len = 0;
    uint8_t lo  = 0x80;
    uint8_t hi  = 0xBF;
    if      (b0 >= 0xC2 && b0 <= 0xDF) { len = 2; }
    else if (b0 == 0xE0)               { len = 3; lo = 0xA0; }   // no overlongs
    else if (b0 >= 0xE1 && b0 <= 0xEC) { len = 3; }
    else if (b0 == 0xED)               { len = 3; hi = 0x9F; }   // no surrogates
    else if (b0 >= 0xEE && b0 <= 0xEF) { len = 3; }
    else if (b0 == 0xF0)               { len = 4; lo = 0x90; }   // no overlongs
    else if (b0 >= 0xF1 && b0 <= 0xF3) { len = 4; }
    else if (b0 == 0xF4)               { len = 4; hi = 0x8F; }   // <= U+10FFFF

    if (len == 0) {                    // stray continuation or invalid lead
      out += REPLACEMENT;
      ++i;
      continue;
    }

    // Walk continuation bytes; stop at the first one that does not fit
    size_t good = 1;
    while (good < len && i + good < n) {
      const uint8_t b = static_cast<uint8_t>(content_[i + good]);
      const uint8_t min = (good == 1) ? lo : 0x80;
      const uint8_t max = (good == 1) ? hi : 0xBF;
      if (b < min || b > max) break;
      ++good;
    }

    if (good == len) {
      out.append(content_.data() + i, len);
    } else {
      out += REPLACEMENT;
    }
    i += good;
  }
  return out;
}

const char* status_name(MessageStatus status) {
  switch (status) {
    case MessageStatus::Ok:                return "ok";
    case MessageStatus::TooLarge:          return "too_large";
    case MessageStatus::ContainsSeparator: return "contains_separator";
  }
  return "unknown";
}

} // namespace floodnet
