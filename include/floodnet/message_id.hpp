/**
 * @file message_id.hpp
 * @brief floodnet MessageID: 16-byte random identity carried by every frame.
 *
 * @details
 * Every message that enters the mesh is stamped exactly once, at the node
 * where an operator typed `broadcast <text>`. The stamp is a 16-byte random
 * value laid out like an RFC 4122 version-4 UUID (version nibble = 4,
 * variant bits = 10). Forwarding nodes copy the id verbatim from the wire;
 * nobody ever regenerates it. That is what lets the dedup cache recognize a
 * message no matter which neighbour it arrives from.
 *
 * ### Byte layout (16 bytes, transmitted as-is)
 *
 * | Bytes | Contents                                   |
 * |-------|--------------------------------------------|
 * | 0–5   | random                                     |
 * | 6     | `0x4?`: version 4 in the upper nibble      |
 * | 7     | random                                     |
 * | 8     | `0b10??????`: RFC 4122 variant            |
 * | 9–15  | random                                     |
 *
 * The all-zero ("nil") id is never produced by generate(). It is still a
 * legal value: the frame codec carries any 16 bytes unchanged.
 *
 * ### Example
 * @code
 * floodnet::MessageID id = floodnet::MessageID::generate();
 * std::cout << id.to_hex_string().c_str();   // "3f1c2a9e-07d4-4b6a-9c11-5e0d2f7a8b34"
 * @endcode
 */

#ifndef FLOODNET_MESSAGE_ID_HPP
#define FLOODNET_MESSAGE_ID_HPP

#include "etl/array.h"
#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>

namespace floodnet {

/**
 * @struct MessageID
 * @brief Opaque 16-byte message identity with value semantics.
 *
 * Compared byte-for-byte. Cheap to copy (no heap), safe to keep inside the
 * fixed-capacity dedup ring.
 */
struct MessageID {
    static constexpr size_t SIZE = 16;   ///< Bytes on the wire

    etl::array<uint8_t, SIZE> bytes;     ///< Raw id bytes, network order as generated

    /**
     * @brief Default constructor: the nil id (all zero).
     */
    MessageID();

    /**
     * @brief Constructs a MessageID from a raw buffer.
     * @param data Pointer to input buffer.
     * @param len Length of the buffer; must be at least 16 or the id stays nil.
     */
    MessageID(const uint8_t* data, size_t len);

    /**
     * @brief Draws a fresh version-4 id from the thread's random engine.
     *
     * The engine is seeded once per thread from `std::random_device`.
     */
    static MessageID generate();

    /**
     * @brief Copies the 16 id bytes into `out_buf` (at least 16 bytes).
     */
    void pack(uint8_t* out_buf) const;

    /**
     * @brief Loads the id from `in_buf`. Buffers shorter than 16 bytes yield nil.
     */
    void unpack(const uint8_t* in_buf, size_t len);

    /// True when every byte is zero.
    bool is_nil() const;

    /**
     * @brief Canonical lowercase 8-4-4-4-12 rendering for logs.
     */
    etl::string<36> to_hex_string() const;

    bool operator==(const MessageID& other) const;
    bool operator!=(const MessageID& other) const { return !(*this == other); }
};

} // namespace floodnet

#endif // FLOODNET_MESSAGE_ID_HPP
