// ============================================================================
// frame.cpp: implementation for frame.hpp
// For the block layout see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "floodnet/frame.hpp"

#include <string>

namespace floodnet {
namespace frame {

// ---------------------------------------------------------------------------
// encode()
// --------
// Lay out content, separator and id inside a zeroed block.
//
// Returns: Ok, or MessageTooLarge if the message cannot fit. Message::create
// already enforces the size rule, so this is the last line before the wire.
// ---------------------------------------------------------------------------
FrameStatus encode(const Message& msg, Frame& out) {
    const size_t len = msg.content().size();
    if (len + 1 + MessageID::SIZE > CAPACITY) {
        return FrameStatus::MessageTooLarge;
    }

    out.fill(0);                                   // padding + separator in one go
    for (size_t i = 0; i < len; ++i) {
        out[i] = static_cast<uint8_t>(msg.content()[i]);
    }
    // out[len] stays 0x00: the separator
    msg.id().pack(out.data() + len + 1);
    return FrameStatus::Ok;
}

// ---------------------------------------------------------------------------
// decode()
// --------
// Find the first zero, take the 16 bytes after it as the id.
//
// Returns: Ok, MissingSeparator or CorruptId.
//
// Notes:
// - sep <= CONTENT_MAX is implied by the id bounds check, so the content
//   always fits Message::ContentStr.
// ---------------------------------------------------------------------------
FrameStatus decode(const Frame& in, Message& out) {
    size_t sep = 0;
    while (sep < CAPACITY && in[sep] != 0) {
        ++sep;
    }
    if (sep == CAPACITY) {
        return FrameStatus::MissingSeparator;
    }

    if (sep + 1 + MessageID::SIZE > CAPACITY) {
        return FrameStatus::CorruptId;             // id would run past the block
    }

    const MessageID id(in.data() + sep + 1, MessageID::SIZE);   // any 16 bytes, nil included

    const std::string text(reinterpret_cast<const char*>(in.data()), sep);
    Message decoded;
    if (Message::create(text, id, decoded) != MessageStatus::Ok) {
        return FrameStatus::MessageTooLarge;       // unreachable given the checks above
    }
    out = decoded;
    return FrameStatus::Ok;
}

const char* status_name(FrameStatus status) {
    switch (status) {
        case FrameStatus::Ok:               return "ok";
        case FrameStatus::MessageTooLarge:  return "message_too_large";
        case FrameStatus::MissingSeparator: return "missing_separator";
        case FrameStatus::CorruptId:        return "corrupt_id";
    }
    return "unknown";
}

} // namespace frame
} // namespace floodnet
