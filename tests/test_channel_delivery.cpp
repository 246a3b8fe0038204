// End-to-end: two channels talking through the packet codec and a lossy link.
#include <doctest/doctest.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "ordlink/link_simulator.hpp"
#include "ordlink/packet.hpp"
#include "ordlink/reliable_ordered_channel.hpp"

using namespace ordlink;

namespace {

Payload numbered(uint32_t i) {
    Payload p{static_cast<uint8_t>(i >> 8), static_cast<uint8_t>(i)};
    p.insert(p.end(), i % 17, static_cast<uint8_t>(i));
    return p;
}

struct Side {
    ReliableOrderedChannel channel;
    uint16_t               next_sequence{0};
    std::vector<uint16_t>  acks;
    std::vector<Payload>   delivered;
    uint32_t               max_packet_bytes{0};

    explicit Side(const ReliableOrderedConfig& cfg) : channel(0, cfg) {}
};

void transmit(Side& s, LinkSimulator& link, TimeMs now, std::optional<uint32_t> budget_bits) {
    PacketHeader header;
    header.sequence = s.next_sequence++;
    for (uint16_t a : s.acks) {
        if (header.acks.full()) break;
        header.acks.push_back(a);
    }
    s.acks.clear();

    std::optional<uint32_t> room = budget_bits;
    if (room) {
        const uint32_t overhead = static_cast<uint32_t>(packet_overhead_bytes(header.acks.size()) * 8);
        *room = *room > overhead ? *room - overhead : 0;
    }

    MessageList messages;
    s.channel.get_messages_to_send(room, header.sequence, messages);

    std::vector<uint8_t> bytes;
    std::string err;
    REQUIRE(write_packet(header, messages, bytes, err));
    if (bytes.size() > s.max_packet_bytes) s.max_packet_bytes = static_cast<uint32_t>(bytes.size());
    link.send(bytes, now);
}

void deliver(Side& s, LinkSimulator& link, TimeMs now) {
    std::vector<std::vector<uint8_t>> packets;
    link.receive(now, packets);
    for (const auto& bytes : packets) {
        PacketHeader header;
        MessageList messages;
        std::string err;
        REQUIRE(read_packet(bytes.data(), bytes.size(), header, messages, err));
        for (uint16_t a : header.acks) s.channel.process_ack(a);
        s.channel.process_messages(std::move(messages));
        s.acks.push_back(header.sequence);
    }
    Payload p;
    while (s.channel.receive_message(p)) s.delivered.push_back(p);
}

// Push `count` messages from a to b. Returns ticks used, or 0 if it never finished.
uint32_t run(Side& a, Side& b, const LinkConfig& link_cfg, uint32_t count,
             std::optional<uint32_t> budget_bits, uint32_t max_ticks = 20000) {
    LinkSimulator a_to_b(link_cfg, 11);
    LinkSimulator b_to_a(link_cfg, 22);
    uint32_t queued = 0;

    for (uint32_t tick = 0; tick < max_ticks; ++tick) {
        const TimeMs now = tick * 10ull;
        a.channel.update_current_time(now);
        b.channel.update_current_time(now);

        deliver(a, b_to_a, now);
        deliver(b, a_to_b, now);

        if (b.delivered.size() == count && !a.channel.has_messages_to_send()) return tick;

        while (queued < count && a.channel.send_message(numbered(queued)) == SendResult::Ok) ++queued;

        transmit(a, a_to_b, now, budget_bits);
        transmit(b, b_to_a, now, budget_bits);
    }
    return 0;
}

void check_in_order(const Side& b, uint32_t count) {
    REQUIRE(b.delivered.size() == count);
    for (uint32_t i = 0; i < count; ++i) {
        CHECK(b.delivered[i] == numbered(i));
    }
}

} // namespace

TEST_CASE("Round trip over a clean link delivers everything without resends") {
    ReliableOrderedConfig cfg;
    Side a(cfg), b(cfg);
    LinkConfig link;
    link.latency_ms = 20;

    CHECK(run(a, b, link, 300, std::nullopt) > 0);
    check_in_order(b, 300);
    CHECK(a.channel.counters().messages_resent == 0);
    CHECK(a.channel.counters().messages_acked == 300);
    CHECK(b.channel.counters().messages_duplicate == 0);
    CHECK(b.channel.counters().messages_stale == 0);
}

TEST_CASE("Loss, jitter and duplicates still give exactly-once in-order delivery") {
    ReliableOrderedConfig cfg;
    cfg.message_send_queue_size    = 64;
    cfg.message_receive_queue_size = 64;
    Side a(cfg), b(cfg);

    LinkConfig link;
    link.latency_ms          = 30;
    link.jitter_ms           = 25;
    link.packet_loss_percent = 20.0f;
    link.duplicate_percent   = 15.0f;

    CHECK(run(a, b, link, 500, std::nullopt) > 0);
    check_in_order(b, 500);
    CHECK(a.channel.counters().messages_resent > 0);
    CHECK(b.channel.error() == ChannelError::None);
    CHECK(b.channel.counters().messages_received == 500);
}

TEST_CASE("A per-packet bit budget bounds every packet on the wire") {
    ReliableOrderedConfig cfg;
    Side a(cfg), b(cfg);
    LinkConfig link;
    link.latency_ms          = 15;
    link.packet_loss_percent = 5.0f;

    const uint32_t budget_bytes = 64;
    CHECK(run(a, b, link, 200, budget_bytes * 8) > 0);
    check_in_order(b, 200);
    CHECK(a.max_packet_bytes <= budget_bytes);
}

TEST_CASE("Resends happen only after the resend interval") {
    // Acks never come back: every selection after the first is a resend.
    ReliableOrderedConfig cfg;
    cfg.message_resend_time_ms = 100;
    ReliableOrderedChannel ch(0, cfg);
    REQUIRE(ch.send_message(numbered(1)) == SendResult::Ok);

    uint16_t seq = 0;
    uint32_t selections = 0;
    for (TimeMs now = 0; now <= 1000; now += 10) {
        ch.update_current_time(now);
        MessageList out;
        if (ch.get_messages_to_send(std::nullopt, seq++, out)) ++selections;
    }
    // sent at 0, 100, ..., 1000
    CHECK(selections == 11);
    CHECK(ch.counters().messages_resent == 10);
}
