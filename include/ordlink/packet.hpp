#pragma once

/**
 * @file packet.hpp
 * @brief Minimal packet codec: one transport sequence, its piggybacked acks, and a message batch.
 *
 * @details
 * OVERVIEW
 * --------
 * The reliable-ordered channel does not care how packets look on the wire;
 * it only needs a packet sequence per outgoing batch and a callback when
 * that sequence is acknowledged. This codec is the smallest framing that
 * carries both, used by the soak driver and by tests that exercise the
 * channel through real bytes.
 *
 * LAYOUT (all integers big endian)
 * --------------------------------
 *   sequence       u16   transport sequence of this packet
 *   ack_count      u8    number of ack entries that follow (0..255)
 *   acks[]         u16   sequences of packets the sender has received
 *   message_count  u16   number of messages that follow
 *   messages[]           Message wire form: id u16, len u16, payload
 *
 * Example: sequence 7, acking 3 and 4, carrying message {id 0, "hi"}:
 * @code
 *   00 07 | 02 | 00 03 00 04 | 00 01 | 00 00 00 02 68 69
 * @endcode
 *
 * ERRORS
 * ------
 * Both directions return false with a reason token in `err`:
 *   write: "too_many_messages", "message_too_large"
 *   read:  "truncated_header", "truncated_acks", "truncated_message_count",
 *          "truncated_message", "trailing_bytes"
 *
 * The codec does not authenticate or checksum anything. The link is assumed
 * to deliver packets intact or not at all.
 */

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

#include "etl/vector.h"
#include "ordlink/message.hpp"

namespace ordlink {

/// Most acks one packet can carry (the count is a single byte).
static constexpr size_t MAX_ACKS_PER_PACKET = 255;

/// Sequence plus piggybacked acks. Acks live in fixed storage; no heap.
struct PacketHeader {
    uint16_t sequence{0};
    etl::vector<uint16_t, MAX_ACKS_PER_PACKET> acks;
};

/// @brief Bytes of framing around the messages for a header with `num_acks` acks.
inline size_t packet_overhead_bytes(size_t num_acks) {
    return 2 + 1 + 2 * num_acks + 2;
}

/**
 * @brief Encode `header` and `messages` into `out` (replacing its contents).
 * @return false with `err` set if the batch cannot be represented.
 */
bool write_packet(const PacketHeader& header, const MessageList& messages,
                  std::vector<uint8_t>& out, std::string& err);

/**
 * @brief Decode one whole packet.
 *
 * `len` must be exactly the packet; leftover bytes are an error.
 * On failure `header` and `messages` may hold partial results.
 */
bool read_packet(const uint8_t* data, size_t len, PacketHeader& header,
                 MessageList& messages, std::string& err);

} // namespace ordlink
