// -----------------------------------------------------------------------------
// @file message_id.cpp
// @brief Implementation of the MessageID struct carried in every floodnet frame.
//
// Implemented here:
// - Constructors (nil, from raw buffer)
// - Random version-4 generation
// - Packing and unpacking to/from raw byte arrays
// - Canonical hex rendering for logs
// -----------------------------------------------------------------------------
#include "floodnet/message_id.hpp"

#include <array>
#include <random>

namespace floodnet {

// =============================================================================
// Constructors
// =============================================================================

// Default constructor.
// All sixteen bytes zero: the nil id.
MessageID::MessageID() {
    bytes.fill(0);
}

// Constructor from raw byte array (usually straight out of a received frame)
MessageID::MessageID(const uint8_t* data, size_t len) {
    // Delegate directly to unpack(): short buffers fall back to nil
    unpack(data, len);
}

// =============================================================================
// Generation
// =============================================================================

// 16 words (512 bits) of OS entropy through seed_seq: the id stream is not
// limited to 2^32 starting points.
static std::mt19937_64 make_engine() {
    std::random_device rd;
    std::array<std::random_device::result_type, 16> words{};
    for (auto& w : words) w = rd();
    std::seed_seq seq(words.begin(), words.end());
    return std::mt19937_64(seq);
}

// One engine per thread, seeded the first time a thread asks for an id.
// The event loop is the only caller in practice.
MessageID MessageID::generate() {
    static thread_local std::mt19937_64 engine = make_engine();

    MessageID id;
    const uint64_t hi = engine();
    const uint64_t lo = engine();

    // Spread the two 64-bit draws over the 16 bytes, high byte first
    for (size_t i = 0; i < 8; ++i) {
        id.bytes[i]     = static_cast<uint8_t>((hi >> (56 - 8 * i)) & 0xFF);
        id.bytes[8 + i] = static_cast<uint8_t>((lo >> (56 - 8 * i)) & 0xFF);
    }

    // Version 4 in the upper nibble of byte 6
    id.bytes[6] = static_cast<uint8_t>((id.bytes[6] & 0x0F) | 0x40);

    // RFC 4122 variant (binary 10) in the top bits of byte 8.
    // This also guarantees the id is never nil.
    id.bytes[8] = static_cast<uint8_t>((id.bytes[8] & 0x3F) | 0x80);

    return id;
}

// =============================================================================
// Packing & Unpacking
// =============================================================================

void MessageID::pack(uint8_t* out_buf) const {
    for (size_t i = 0; i < SIZE; ++i) {
        out_buf[i] = bytes[i];
    }
}

void MessageID::unpack(const uint8_t* in_buf, size_t len) {
    // If the buffer is too short (or missing), clear all bytes for safety
    if (in_buf == nullptr || len < SIZE) {
        bytes.fill(0);
        return;
    }
    for (size_t i = 0; i < SIZE; ++i) {
        bytes[i] = in_buf[i];
    }
}

// =============================================================================
// Queries & Conversion
// =============================================================================

bool MessageID::is_nil() const {
    for (size_t i = 0; i < SIZE; ++i) {
        if (bytes[i] != 0) return false;
    }
    return true;
}

bool MessageID::operator==(const MessageID& other) const {
    for (size_t i = 0; i < SIZE; ++i) {
        if (bytes[i] != other.bytes[i]) return false;
    }
    return true;
}

// "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx", dashes after bytes 4, 6, 8 and 10
etl::string<36> MessageID::to_hex_string() const {
    etl::string<36> hex;
    for (size_t i = 0; i < SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            hex += '-';
        }
        hex += "0123456789abcdef"[bytes[i] >> 4];
        hex += "0123456789abcdef"[bytes[i] & 0x0F];
    }
    return hex;
}

} // namespace floodnet
