// -----------------------------------------------------------------------------
// packet.cpp — ordlink packet codec (see include/ordlink/packet.hpp for layout)
//
// Reader policy: every length is checked before it is trusted; the first
// shortfall stops decoding with a reason token. No exceptions, no asserts.
// -----------------------------------------------------------------------------
#include "ordlink/packet.hpp"

#include <utility>

namespace ordlink {

namespace {

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));   // high byte first
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

} // namespace

bool write_packet(const PacketHeader& header, const MessageList& messages,
                  std::vector<uint8_t>& out, std::string& err) {
    if (messages.size() > 0xFFFF) { err = "too_many_messages"; return false; }

    out.clear();
    out.reserve(packet_overhead_bytes(header.acks.size()));

    put_u16(out, header.sequence);
    out.push_back(static_cast<uint8_t>(header.acks.size()));    // <= 255 by construction
    for (uint16_t ack : header.acks) put_u16(out, ack);

    put_u16(out, static_cast<uint16_t>(messages.size()));
    for (const Message& m : messages) {
        if (!m.pack(out)) { err = "message_too_large"; return false; }
    }
    return true;
}

bool read_packet(const uint8_t* data, size_t len, PacketHeader& header,
                 MessageList& messages, std::string& err) {
    size_t pos = 0;

    // sequence + ack_count
    if (!data || len < 3) { err = "truncated_header"; return false; }
    header.sequence = get_u16(data);
    const size_t ack_count = data[2];
    pos = 3;

    // acks
    if (len - pos < ack_count * 2) { err = "truncated_acks"; return false; }
    header.acks.clear();
    for (size_t i = 0; i < ack_count; ++i) {
        header.acks.push_back(get_u16(data + pos));
        pos += 2;
    }

    // message_count
    if (len - pos < 2) { err = "truncated_message_count"; return false; }
    const size_t message_count = get_u16(data + pos);
    pos += 2;

    // messages
    messages.clear();
    messages.reserve(message_count);
    for (size_t i = 0; i < message_count; ++i) {
        Message m;
        const size_t used = m.unpack(data + pos, len - pos);
        if (used == 0) { err = "truncated_message"; return false; }
        pos += used;
        messages.push_back(std::move(m));
    }

    if (pos != len) { err = "trailing_bytes"; return false; }
    return true;
}

} // namespace ordlink
