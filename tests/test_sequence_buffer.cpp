#include <doctest/doctest.h>
#include <string>
#include "ordlink/sequence_buffer.hpp"

using namespace ordlink;

TEST_CASE("SequenceBuffer starts empty") {
    SequenceBuffer<int> buf(8);
    CHECK(buf.capacity() == 8);
    CHECK(buf.high_water() == 0);
    for (uint16_t s = 0; s < 8; ++s) {
        CHECK_FALSE(buf.exists(s));
        CHECK(buf.get(s) == nullptr);
    }
}

TEST_CASE("SequenceBuffer zero capacity becomes one slot") {
    SequenceBuffer<int> buf(0);
    CHECK(buf.capacity() == 1);
    buf.insert(7, 70);
    CHECK(buf.exists(7));
}

TEST_CASE("SequenceBuffer insert/get/exists are keyed on the exact sequence") {
    SequenceBuffer<std::string> buf(4);
    std::string* slot = buf.insert(2, "two");
    REQUIRE(slot != nullptr);
    CHECK(*slot == "two");

    CHECK(buf.exists(2));
    REQUIRE(buf.get(2) != nullptr);
    CHECK(*buf.get(2) == "two");

    // 6 and 10 share slot 2 but are different sequences
    CHECK_FALSE(buf.exists(6));
    CHECK(buf.get(10) == nullptr);
}

TEST_CASE("SequenceBuffer insert overwrites a colliding older entry") {
    SequenceBuffer<int> buf(4);
    buf.insert(1, 100);
    buf.insert(5, 500);   // same slot as 1

    CHECK_FALSE(buf.exists(1));
    CHECK(buf.exists(5));
    CHECK(*buf.get(5) == 500);
}

TEST_CASE("SequenceBuffer remove returns the value once and frees the slot") {
    SequenceBuffer<std::string> buf(4);
    buf.insert(3, "abc");

    auto v = buf.remove(3);
    REQUIRE(v.has_value());
    CHECK(*v == "abc");
    CHECK_FALSE(buf.exists(3));

    CHECK_FALSE(buf.remove(3).has_value());
    CHECK_FALSE(buf.remove(7).has_value());   // never inserted
}

TEST_CASE("SequenceBuffer remove of a non-matching sequence leaves the slot alone") {
    SequenceBuffer<int> buf(4);
    buf.insert(9, 90);                        // slot 1
    CHECK_FALSE(buf.remove(1).has_value());
    CHECK(buf.exists(9));
}

TEST_CASE("SequenceBuffer high_water is one past the newest insert") {
    SequenceBuffer<int> buf(16);
    buf.insert(0, 0);
    CHECK(buf.high_water() == 1);
    buf.insert(5, 5);
    CHECK(buf.high_water() == 6);
    buf.insert(3, 3);                         // older: no change
    CHECK(buf.high_water() == 6);
    buf.remove(5);                            // removal never lowers it
    CHECK(buf.high_water() == 6);
}

TEST_CASE("SequenceBuffer high_water follows wraparound") {
    SequenceBuffer<int> buf(16);
    buf.insert(65534, 1);
    CHECK(buf.high_water() == 65535);
    buf.insert(65535, 2);
    CHECK(buf.high_water() == 0);
    buf.insert(2, 3);
    CHECK(buf.high_water() == 3);
    CHECK(buf.exists(65535));
    CHECK(buf.exists(2));
}

TEST_CASE("SequenceBuffer reset clears entries and high water") {
    SequenceBuffer<int> buf(4);
    buf.insert(1, 1);
    buf.insert(2, 2);
    buf.reset();
    CHECK_FALSE(buf.exists(1));
    CHECK_FALSE(buf.exists(2));
    CHECK(buf.high_water() == 0);

    buf.insert(40, 4);
    CHECK(buf.high_water() == 41);
}
