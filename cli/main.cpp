/**
 * @file main.cpp
 * @brief ordlink-soak — drive two reliable-ordered channels over a simulated lossy link.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); optionally load channel settings from JSON.
 *  - Build two endpoints, A and B. Each owns one channel, a packet sequence
 *    counter and a list of packet sequences it still has to acknowledge.
 *  - Per tick: advance time, deliver due packets (acks first, then messages),
 *    drain and verify received payloads, then build one packet per endpoint.
 *  - Stop when both sides received everything and nothing is unacked, or
 *    when the tick limit runs out. Report pretty or JSON (nlohmann::json).
 *
 * Notes:
 *  - Payload i is deterministic: 4-byte big-endian index, then filler bytes,
 *    so the receiver can verify order and content without keeping copies.
 *  - Acks ride once. If the packet carrying an ack is lost, the sender
 *    resends the messages and the receiver drops them as stale.
 *  - Diagnostics go to stderr as `status=... reason=...` lines; the report
 *    goes to stdout.
 *
 * Exit codes: 0 ok, 2 bad args/config, 3 order/content violation,
 *             4 incomplete at tick limit, 5 channel error (Desync, or a
 *             selected batch the packet codec cannot encode).
 */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "ordlink/channel_config_file.hpp"
#include "ordlink/link_simulator.hpp"
#include "ordlink/packet.hpp"
#include "ordlink/reliable_ordered_channel.hpp"

using json = nlohmann::json;
using namespace ordlink;

namespace {

constexpr int EXIT_BAD_ARGS   = 2;
constexpr int EXIT_VIOLATION  = 3;
constexpr int EXIT_INCOMPLETE = 4;
constexpr int EXIT_CHANNEL    = 5;

// ---------- payload generation / verification ----------

Payload make_payload(uint32_t index, uint32_t max_payload) {
  Payload p;
  p.push_back(static_cast<uint8_t>((index >> 24) & 0xFF));
  p.push_back(static_cast<uint8_t>((index >> 16) & 0xFF));
  p.push_back(static_cast<uint8_t>((index >> 8) & 0xFF));
  p.push_back(static_cast<uint8_t>(index & 0xFF));
  const uint32_t filler = max_payload > 4 ? index % (max_payload - 4 + 1) : 0;
  p.insert(p.end(), filler, static_cast<uint8_t>(index & 0xFF));
  return p;
}

// ---------- endpoint ----------

struct Endpoint {
  std::string              name;
  std::unique_ptr<Channel> channel;
  uint16_t                 next_packet_sequence{0};
  std::vector<uint16_t>    pending_acks;   ///< received packet sequences not yet acked

  uint32_t messages_queued{0};     ///< payloads accepted by send_message()
  uint32_t messages_verified{0};   ///< payloads received in order with correct content
  uint64_t packets_sent{0};
  uint64_t packets_received{0};
  uint64_t packets_bad{0};         ///< failed to decode
  uint64_t packets_unencodable{0}; ///< batch write_packet() refused
};

struct RunOptions {
  uint32_t messages{1000};
  uint32_t max_payload{64};
  uint64_t max_ticks{100000};
  uint32_t tick_ms{10};
  std::optional<uint32_t> budget_bits;
  bool     verbose{false};
};

// Queue as many of this endpoint's messages as the channel accepts right now.
bool top_up(Endpoint& ep, const RunOptions& opt) {
  while (ep.messages_queued < opt.messages) {
    const SendResult r = ep.channel->send_message(make_payload(ep.messages_queued, opt.max_payload));
    if (r == SendResult::QueueFull) return true;    // try again next tick
    if (r != SendResult::Ok) {
      std::cerr << "status=error reason=send_" << to_string(r)
                << " endpoint=" << ep.name << " index=" << ep.messages_queued << "\n";
      return false;
    }
    ++ep.messages_queued;
  }
  return true;
}

// Build and transmit one packet: pending acks + whatever the channel wants to send.
// false if the batch could not be encoded; the channel already counts it as sent.
bool send_packet(Endpoint& ep, LinkSimulator& link, TimeMs now, const RunOptions& opt) {
  PacketHeader header;
  header.sequence = ep.next_packet_sequence++;

  // newest acks first survive when there are more than fit
  size_t skip = ep.pending_acks.size() > MAX_ACKS_PER_PACKET
                  ? ep.pending_acks.size() - MAX_ACKS_PER_PACKET : 0;
  for (size_t i = skip; i < ep.pending_acks.size(); ++i) header.acks.push_back(ep.pending_acks[i]);
  ep.pending_acks.clear();

  std::optional<uint32_t> available = opt.budget_bits;
  if (available) {
    const uint32_t overhead_bits = static_cast<uint32_t>(packet_overhead_bytes(header.acks.size()) * 8);
    *available = *available > overhead_bits ? *available - overhead_bits : 0;
  }

  MessageList messages;
  ep.channel->get_messages_to_send(available, header.sequence, messages);   // false => empty batch

  std::vector<uint8_t> bytes;
  std::string err;
  if (!write_packet(header, messages, bytes, err)) {
    ++ep.packets_unencodable;
    std::cerr << "status=error reason=" << err << " endpoint=" << ep.name
              << " seq=" << header.sequence << "\n";
    return false;
  }

  if (opt.verbose) {
    std::cerr << "t=" << now << " ep=" << ep.name << " tx seq=" << header.sequence
              << " acks=" << header.acks.size() << " msgs=" << messages.size()
              << " bytes=" << bytes.size() << "\n";
  }

  link.send(bytes, now);
  ++ep.packets_sent;
  return true;
}

// Apply one received packet. Returns false on a content/order violation.
bool on_packet(Endpoint& ep, const std::vector<uint8_t>& bytes, const RunOptions& opt) {
  PacketHeader header;
  MessageList messages;
  std::string err;
  if (!read_packet(bytes.data(), bytes.size(), header, messages, err)) {
    ++ep.packets_bad;
    std::cerr << "status=warn reason=" << err << " endpoint=" << ep.name << "\n";
    return true;
  }
  ++ep.packets_received;

  for (uint16_t ack : header.acks) ep.channel->process_ack(ack);
  if (!messages.empty()) ep.channel->process_messages(std::move(messages));
  ep.pending_acks.push_back(header.sequence);

  Payload p;
  while (ep.channel->receive_message(p)) {
    if (p != make_payload(ep.messages_verified, opt.max_payload)) {
      std::cerr << "status=error reason=payload_mismatch endpoint=" << ep.name
                << " expected_index=" << ep.messages_verified << "\n";
      return false;
    }
    ++ep.messages_verified;
  }
  return true;
}

json endpoint_report(const Endpoint& ep) {
  const ChannelCounters& c = ep.channel->counters();
  json j;
  j["packets_sent"]       = ep.packets_sent;
  j["packets_received"]   = ep.packets_received;
  j["packets_bad"]        = ep.packets_bad;
  j["packets_unencodable"] = ep.packets_unencodable;
  j["messages_verified"]  = ep.messages_verified;
  j["messages_sent"]      = c.messages_sent;
  j["messages_received"]  = c.messages_received;
  j["messages_resent"]    = c.messages_resent;
  j["messages_acked"]     = c.messages_acked;
  j["messages_rejected"]  = c.messages_rejected;
  j["messages_stale"]     = c.messages_stale;
  j["messages_duplicate"] = c.messages_duplicate;
  j["error"]              = to_string(ep.channel->error());
  return j;
}

json link_report(const LinkSimulator& link) {
  const LinkCounters& c = link.counters();
  json j;
  j["sent"] = c.sent; j["dropped"] = c.dropped; j["duplicated"] = c.duplicated;
  j["delivered"] = c.delivered; j["overflowed"] = c.overflowed;
  return j;
}

void print_pretty(const json& report) {
  std::cout << "status=" << report["status"].get<std::string>()
            << " ticks=" << report["ticks"] << " time_ms=" << report["time_ms"] << "\n";
  for (const char* side : {"A", "B"}) {
    std::cout << "  [" << side << "]";
    for (const auto& kv : report["endpoints"][side].items()) std::cout << " " << kv.key() << "=" << kv.value();
    std::cout << "\n";
  }
  for (const char* dir : {"A_to_B", "B_to_A"}) {
    std::cout << "  [" << dir << "]";
    for (const auto& kv : report["links"][dir].items()) std::cout << " " << kv.key() << "=" << kv.value();
    std::cout << "\n";
  }
}

} // namespace

// ---------- main ----------

int main(int argc, char** argv) {
  RunOptions opt;
  LinkConfig link_cfg;
  std::string config_path;
  std::string format = "pretty";
  uint64_t seed = 1;
  uint32_t budget_bits = 0;

  CLI::App app{"ordlink soak: two reliable-ordered channels over a lossy simulated link"};

  app.add_option("--config", config_path, "Channel settings (JSON)");
  app.add_option("--messages", opt.messages, "Messages each endpoint sends")->capture_default_str();
  app.add_option("--max-payload", opt.max_payload, "Largest payload in bytes (>= 4)")
     ->capture_default_str()->check(CLI::Range(uint32_t{4}, uint32_t{Message::MAX_PAYLOAD_BYTES}));
  app.add_option("--ticks", opt.max_ticks, "Tick limit")->capture_default_str();
  app.add_option("--tick-ms", opt.tick_ms, "Logical ms per tick")->capture_default_str()
     ->check(CLI::Range(uint32_t{1}, uint32_t{60000}));
  CLI::Option* opt_budget = app.add_option("--budget-bits", budget_bits, "Bits available per packet for messages+framing");
  app.add_option("--loss", link_cfg.packet_loss_percent, "Packet loss %")->check(CLI::Range(0.0f, 100.0f));
  app.add_option("--latency", link_cfg.latency_ms, "One-way latency (ms)");
  app.add_option("--jitter", link_cfg.jitter_ms, "Jitter +/- (ms)");
  app.add_option("--duplicates", link_cfg.duplicate_percent, "Duplicate packet %")->check(CLI::Range(0.0f, 100.0f));
  app.add_option("--seed", seed, "Simulator seed")->capture_default_str();
  app.add_option("--format", format, "Report format: pretty|json")->check(CLI::IsMember({"pretty", "json"}));
  app.add_flag("--verbose", opt.verbose, "Per-packet trace on stderr");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  if (opt_budget->count() > 0) {
    // the largest payload plus framing with one ack must fit, or the run can never finish
    const size_t need_bytes = packet_overhead_bytes(1) + serialized_size_bytes(opt.max_payload);
    if (static_cast<uint64_t>(budget_bits) < need_bytes * 8) {
      std::cerr << "status=error reason=budget_bits_too_small need=" << need_bytes * 8 << "\n";
      return EXIT_BAD_ARGS;
    }
    opt.budget_bits = budget_bits;
  }

  // -------- channel settings --------
  ReliableOrderedConfig cfg;
  std::string err;
  if (!config_path.empty()) {
    if (!load_config_json(config_path, cfg, err)) {
      std::cerr << "status=error reason=" << err << " path=" << config_path << "\n";
      return EXIT_BAD_ARGS;
    }
  } else if (!validate(cfg, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return EXIT_BAD_ARGS;
  }

  if (opt.verbose) std::cerr << "config=" << json::parse(config_to_json(cfg)).dump() << "\n";

  // -------- endpoints & links --------
  Endpoint a; a.name = "A"; a.channel = cfg.new_channel(0);
  Endpoint b; b.name = "B"; b.channel = cfg.new_channel(0);
  LinkSimulator a_to_b(link_cfg, seed);
  LinkSimulator b_to_a(link_cfg, seed ^ 0x9E3779B97F4A7C15ull);

  // -------- run --------
  std::string status = "incomplete";
  int exit_code = EXIT_INCOMPLETE;
  uint64_t tick = 0;
  TimeMs now = 0;

  for (; tick < opt.max_ticks; ++tick) {
    now = tick * opt.tick_ms;
    a.channel->update_current_time(now);
    b.channel->update_current_time(now);

    std::vector<std::vector<uint8_t>> inbound;
    bool ok = true;
    if (b_to_a.receive(now, inbound)) {
      for (const auto& pkt : inbound) ok = ok && on_packet(a, pkt, opt);
    }
    inbound.clear();
    if (ok && a_to_b.receive(now, inbound)) {
      for (const auto& pkt : inbound) ok = ok && on_packet(b, pkt, opt);
    }
    if (!ok) { status = "violation"; exit_code = EXIT_VIOLATION; break; }

    if (a.channel->error() != ChannelError::None || b.channel->error() != ChannelError::None) {
      std::cerr << "status=error reason=channel_" << to_string(a.channel->error() != ChannelError::None
                                                               ? a.channel->error() : b.channel->error())
                << "\n";
      status = "channel_error"; exit_code = EXIT_CHANNEL; break;
    }

    const bool done = a.messages_verified == opt.messages && b.messages_verified == opt.messages &&
                      !a.channel->has_messages_to_send() && !b.channel->has_messages_to_send();
    if (done) { status = "ok"; exit_code = 0; break; }

    if (!top_up(a, opt) || !top_up(b, opt)) { status = "bad_args"; exit_code = EXIT_BAD_ARGS; break; }

    if (!send_packet(a, a_to_b, now, opt) || !send_packet(b, b_to_a, now, opt)) {
      status = "packet_error"; exit_code = EXIT_CHANNEL; break;
    }
  }

  if (exit_code == EXIT_INCOMPLETE) {
    std::cerr << "status=error reason=tick_limit ticks=" << opt.max_ticks
              << " a_verified=" << a.messages_verified << " b_verified=" << b.messages_verified << "\n";
  }

  // -------- report --------
  json report;
  report["status"]  = status;
  report["ticks"]   = tick;
  report["time_ms"] = now;
  report["seed"]    = seed;
  report["config"]  = json::parse(config_to_json(cfg));
  report["endpoints"]["A"] = endpoint_report(a);
  report["endpoints"]["B"] = endpoint_report(b);
  report["links"]["A_to_B"] = link_report(a_to_b);
  report["links"]["B_to_A"] = link_report(b_to_a);

  if (format == "json") std::cout << report.dump(2) << "\n";
  else                  print_pretty(report);

  return exit_code;
}
