// -----------------------------------------------------------------------------
// @file message.cpp
// @brief Implementation of ordlink::Message wire packing.
//
// Layout and field meanings live in include/ordlink/message.hpp.
// Everything here is big endian and bounds-checked; nothing throws.
// -----------------------------------------------------------------------------
#include "ordlink/message.hpp"

#include <utility>

namespace ordlink {

Message::Message(uint16_t message_id, Payload bytes)
: id(message_id), payload(std::move(bytes)) {}

size_t Message::serialized_size_bytes() const {
  return ordlink::serialized_size_bytes(payload.size());
}

uint32_t Message::serialized_size_bits() const {
  // Header + at most 65535 payload bytes always fits in 32 bits once
  // multiplied by 8; oversize payloads are rejected long before this.
  return static_cast<uint32_t>(serialized_size_bytes() * 8);
}

// pack() — append [id:2][len:2][payload] to out.
bool Message::pack(std::vector<uint8_t>& out) const {
  if (payload.size() > MAX_PAYLOAD_BYTES) return false;   // no wire form

  const uint16_t len = static_cast<uint16_t>(payload.size());

  out.reserve(out.size() + HEADER_BYTES + payload.size());
  out.push_back(static_cast<uint8_t>((id >> 8) & 0xFF));   // id, high byte first
  out.push_back(static_cast<uint8_t>(id & 0xFF));
  out.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));  // length, high byte first
  out.push_back(static_cast<uint8_t>(len & 0xFF));
  out.insert(out.end(), payload.begin(), payload.end());
  return true;
}

// unpack() — read one message; report how many bytes it used.
size_t Message::unpack(const uint8_t* data, size_t len) {
  if (!data || len < HEADER_BYTES) return 0;

  const uint16_t msg_id  = static_cast<uint16_t>((data[0] << 8) | data[1]);
  const size_t   msg_len = static_cast<size_t>((data[2] << 8) | data[3]);

  if (len - HEADER_BYTES < msg_len) return 0;  // declared payload runs past the buffer

  id = msg_id;
  payload.assign(data + HEADER_BYTES, data + HEADER_BYTES + msg_len);
  return HEADER_BYTES + msg_len;
}

} // namespace ordlink
