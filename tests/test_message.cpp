#include <doctest/doctest.h>
#include <vector>
#include "ordlink/message.hpp"

using namespace ordlink;

TEST_CASE("Message size accounting: 4 header bytes plus payload") {
    Message empty;
    CHECK(empty.serialized_size_bytes() == 4);
    CHECK(empty.serialized_size_bits() == 32);

    Message m(7, Payload{1, 2, 3});
    CHECK(m.serialized_size_bytes() == 7);
    CHECK(m.serialized_size_bits() == 56);
    CHECK(serialized_size_bytes(100) == 104);
}

TEST_CASE("Message pack writes id and length big endian, then payload") {
    Message m(0x0102, Payload{'h', 'i'});
    std::vector<uint8_t> out{0xAA};             // pack appends
    REQUIRE(m.pack(out));

    const std::vector<uint8_t> expected{0xAA, 0x01, 0x02, 0x00, 0x02, 'h', 'i'};
    CHECK(out == expected);
}

TEST_CASE("Message unpack reads one message and reports bytes used") {
    const std::vector<uint8_t> wire{0xFF, 0xFE, 0x00, 0x03, 'a', 'b', 'c', 0x99};
    Message m;
    CHECK(m.unpack(wire.data(), wire.size()) == 7);
    CHECK(m.id == 0xFFFE);
    CHECK(m.payload == Payload{'a', 'b', 'c'});
}

TEST_CASE("Message unpack rejects short input without touching the message") {
    Message m(5, Payload{9});
    const std::vector<uint8_t> header_only{0x00, 0x01, 0x00};
    CHECK(m.unpack(header_only.data(), header_only.size()) == 0);

    const std::vector<uint8_t> short_payload{0x00, 0x01, 0x00, 0x04, 'x', 'y'};
    CHECK(m.unpack(short_payload.data(), short_payload.size()) == 0);

    CHECK(m.unpack(nullptr, 10) == 0);
    CHECK(m == Message(5, Payload{9}));
}

TEST_CASE("Message pack refuses a payload the length field cannot describe") {
    Message big(1, Payload(Message::MAX_PAYLOAD_BYTES + 1, 0));
    std::vector<uint8_t> out;
    CHECK_FALSE(big.pack(out));
    CHECK(out.empty());
}

TEST_CASE("Message equality compares id and payload") {
    CHECK(Message(1, Payload{1}) == Message(1, Payload{1}));
    CHECK(Message(1, Payload{1}) != Message(2, Payload{1}));
    CHECK(Message(1, Payload{1}) != Message(1, Payload{2}));
}
