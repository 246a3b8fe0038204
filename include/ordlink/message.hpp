/**
 * @file message.hpp
 * @brief ordlink Message — the unit a channel sequences, plus its compact wire form.
 *
 * @details
 * A `Message` is an id and an opaque payload. The channel assigns the id;
 * the payload is whatever the application handed to `send_message()`.
 * ordlink never looks inside the payload.
 *
 * ## Wire form
 *
 * | Field   | Bytes | Encoding                     |
 * |---------|-------|------------------------------|
 * | id      | 2     | u16, big endian              |
 * | length  | 2     | u16, big endian              |
 * | payload | len   | raw bytes                    |
 *
 * So a message costs `4 + payload.size()` bytes on the wire. The channel
 * uses that number (in bits) for packet budget accounting, and the packet
 * codec (packet.hpp) uses pack()/unpack() to lay messages into a packet.
 *
 * ### Example
 * id = 28, payload = "hi" packs to `[0x00, 0x1C, 0x00, 0x02, 'h', 'i']`.
 *
 * @note Payloads larger than 65535 bytes have no wire form. pack() refuses
 *       them and the channel rejects them at send time.
 */
#ifndef ORDLINK_MESSAGE_HPP
#define ORDLINK_MESSAGE_HPP

#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace ordlink {

/// Opaque application bytes carried by a message.
using Payload = std::vector<uint8_t>;

struct Message {
  /// Bytes of wire header in front of every payload (id + length).
  static constexpr size_t HEADER_BYTES      = 4;

  /// Largest payload the 16-bit length field can describe.
  static constexpr size_t MAX_PAYLOAD_BYTES = 0xFFFF;

  /**
   * @brief Message id assigned by the sending channel.
   *
   * Wraps from 65535 to 0. Receivers deliver in id order starting at 0.
   */
  uint16_t id{0};

  /// Application payload (opaque).
  Payload payload;

  Message() = default;
  Message(uint16_t message_id, Payload bytes);

  /// @brief Wire size in bytes: header + payload.
  size_t serialized_size_bytes() const;

  /// @brief Wire size in bits, the unit packet budgets are expressed in.
  uint32_t serialized_size_bits() const;

  /**
   * @brief Append the wire form of this message to `out`.
   * @retval true  Appended.
   * @retval false Payload exceeds MAX_PAYLOAD_BYTES; `out` is unchanged.
   */
  bool pack(std::vector<uint8_t>& out) const;

  /**
   * @brief Parse one message from the front of `data`.
   *
   * @param data Buffer holding at least one packed message.
   * @param len  Bytes available in `data`.
   * @return Bytes consumed, or 0 if `data` is too short for the header or the
   *         declared payload length. On 0 the message is left untouched.
   */
  size_t unpack(const uint8_t* data, size_t len);

  bool operator==(const Message& other) const {
    return id == other.id && payload == other.payload;
  }
  bool operator!=(const Message& other) const { return !(*this == other); }
};

/// A batch of messages, as produced for one packet or consumed from one.
using MessageList = std::vector<Message>;

/// @brief Wire size of a message carrying `payload_len` bytes.
inline size_t serialized_size_bytes(size_t payload_len) {
  return Message::HEADER_BYTES + payload_len;
}

} // namespace ordlink

#endif // ORDLINK_MESSAGE_HPP
