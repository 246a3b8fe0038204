#include <doctest/doctest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include "ordlink/channel_config_file.hpp"

using namespace ordlink;

TEST_CASE("Default ReliableOrderedConfig is valid") {
    ReliableOrderedConfig cfg;
    std::string err;
    CHECK(validate(cfg, err));
    CHECK(cfg.sent_packet_buffer_size == 1024);
    CHECK(cfg.message_send_queue_size == 1024);
    CHECK(cfg.message_receive_queue_size == 1024);
    CHECK(cfg.max_message_per_packet == 256);
    CHECK_FALSE(cfg.packet_budget_bytes.has_value());
    CHECK(cfg.message_resend_time_ms == 100);
}

TEST_CASE("validate names the first field out of range") {
    std::string err;

    ReliableOrderedConfig a;
    a.sent_packet_buffer_size = 0;
    CHECK_FALSE(validate(a, err));
    CHECK(err == "sent_packet_buffer_size_out_of_range");

    ReliableOrderedConfig b;
    b.message_send_queue_size = MAX_QUEUE_CAPACITY + 1;
    CHECK_FALSE(validate(b, err));
    CHECK(err == "message_send_queue_size_out_of_range");

    ReliableOrderedConfig c;
    c.message_receive_queue_size = 0;
    CHECK_FALSE(validate(c, err));
    CHECK(err == "message_receive_queue_size_out_of_range");

    ReliableOrderedConfig d;
    d.max_message_per_packet = 257;
    CHECK_FALSE(validate(d, err));
    CHECK(err == "max_message_per_packet_out_of_range");

    ReliableOrderedConfig e;
    e.packet_budget_bytes = 3;
    CHECK_FALSE(validate(e, err));
    CHECK(err == "packet_budget_bytes_too_small");

    ReliableOrderedConfig edge;
    edge.message_send_queue_size = MAX_QUEUE_CAPACITY;
    edge.max_message_per_packet  = 1;
    edge.packet_budget_bytes     = 4;
    CHECK(validate(edge, err));
}

TEST_CASE("parse_config_json overlays only the keys present") {
    ReliableOrderedConfig cfg;
    std::string err;
    REQUIRE(parse_config_json(R"({"message_send_queue_size": 64, "packet_budget_bytes": 1200,
                                  "message_resend_time_ms": 250})", cfg, err));
    CHECK(cfg.message_send_queue_size == 64);
    REQUIRE(cfg.packet_budget_bytes.has_value());
    CHECK(*cfg.packet_budget_bytes == 1200);
    CHECK(cfg.message_resend_time_ms == 250);
    CHECK(cfg.message_receive_queue_size == 1024);
    CHECK(cfg.max_message_per_packet == 256);
}

TEST_CASE("parse_config_json: null packet_budget_bytes clears the budget") {
    ReliableOrderedConfig cfg;
    cfg.packet_budget_bytes = 500;
    std::string err;
    REQUIRE(parse_config_json(R"({"packet_budget_bytes": null})", cfg, err));
    CHECK_FALSE(cfg.packet_budget_bytes.has_value());
}

TEST_CASE("parse_config_json rejects bad input and leaves the config alone") {
    ReliableOrderedConfig cfg;
    cfg.message_send_queue_size = 77;
    std::string err;

    CHECK_FALSE(parse_config_json("{not json", cfg, err));
    CHECK(err == "json_parse_error");

    CHECK_FALSE(parse_config_json("[1, 2]", cfg, err));
    CHECK(err == "json_not_object");

    CHECK_FALSE(parse_config_json(R"({"message_send_queue_size": "big"})", cfg, err));
    CHECK(err == "message_send_queue_size_not_unsigned");

    CHECK_FALSE(parse_config_json(R"({"message_resend_time_ms": -5})", cfg, err));
    CHECK(err == "message_resend_time_ms_not_unsigned");

    CHECK_FALSE(parse_config_json(R"({"max_message_per_packet": 2.5})", cfg, err));
    CHECK(err == "max_message_per_packet_not_unsigned");

    CHECK_FALSE(parse_config_json(R"({"packet_budget_bytes": true})", cfg, err));
    CHECK(err == "packet_budget_bytes_not_unsigned");

    // well formed but fails validation
    CHECK_FALSE(parse_config_json(R"({"message_send_queue_size": 5, "sent_packet_buffer_size": 0})", cfg, err));
    CHECK(err == "sent_packet_buffer_size_out_of_range");

    CHECK(cfg.message_send_queue_size == 77);
}

TEST_CASE("config_to_json output parses back to the same config") {
    ReliableOrderedConfig cfg;
    cfg.sent_packet_buffer_size    = 256;
    cfg.message_send_queue_size    = 128;
    cfg.message_receive_queue_size = 512;
    cfg.max_message_per_packet     = 32;
    cfg.packet_budget_bytes        = 1400;
    cfg.message_resend_time_ms     = 75;

    ReliableOrderedConfig back;
    std::string err;
    REQUIRE(parse_config_json(config_to_json(cfg), back, err));
    CHECK(back.sent_packet_buffer_size == 256);
    CHECK(back.message_send_queue_size == 128);
    CHECK(back.message_receive_queue_size == 512);
    CHECK(back.max_message_per_packet == 32);
    CHECK(back.packet_budget_bytes == cfg.packet_budget_bytes);
    CHECK(back.message_resend_time_ms == 75);

    CHECK(config_to_json(ReliableOrderedConfig{}).find("\"packet_budget_bytes\": null") != std::string::npos);
}

TEST_CASE("load_config_json reads a file and reports a missing one") {
    ReliableOrderedConfig cfg;
    std::string err;
    CHECK_FALSE(load_config_json("/nonexistent/ordlink/config.json", cfg, err));
    CHECK(err == "config_open_failed");

    const std::string path = "ordlink_test_config.json";
    {
        std::ofstream f(path);
        f << R"({"max_message_per_packet": 16})";
    }
    REQUIRE(load_config_json(path, cfg, err));
    CHECK(cfg.max_message_per_packet == 16);
    std::remove(path.c_str());
}
