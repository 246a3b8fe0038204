// ============================================================================
// channel_config_file.cpp — implementation for channel_config_file.hpp
// For the JSON shape and reason tokens see the matching .hpp.
// ============================================================================

#include "ordlink/channel_config_file.hpp"

#include <fstream>      // std::ifstream for load_config_json
#include <sstream>      // slurp the whole file before parsing
#include <cstdint>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace ordlink {

namespace {

bool in_capacity_range(size_t n) {
  return n >= 1 && n <= MAX_QUEUE_CAPACITY;
}

/*
 * read_unsigned()
 * ---------------
 * Pull an unsigned integer field out of `obj` if present.
 *   - absent key        -> true, `out` untouched
 *   - non-negative int  -> true, `out` set
 *   - anything else     -> false, err = "<key>_not_unsigned"
 * Floats are refused rather than truncated.
 */
bool read_unsigned(const json& obj, const char* key, uint64_t& out, std::string& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_number_unsigned()) {
    err = std::string(key) + "_not_unsigned";
    return false;
  }
  out = it->get<uint64_t>();
  return true;
}

} // namespace

bool validate(const ReliableOrderedConfig& cfg, std::string& err) {
  if (!in_capacity_range(cfg.sent_packet_buffer_size)) {
    err = "sent_packet_buffer_size_out_of_range"; return false;
  }
  if (!in_capacity_range(cfg.message_send_queue_size)) {
    err = "message_send_queue_size_out_of_range"; return false;
  }
  if (!in_capacity_range(cfg.message_receive_queue_size)) {
    err = "message_receive_queue_size_out_of_range"; return false;
  }
  if (cfg.max_message_per_packet < 1 || cfg.max_message_per_packet > MAX_MESSAGES_PER_PACKET_LIMIT) {
    err = "max_message_per_packet_out_of_range"; return false;
  }
  if (cfg.packet_budget_bytes && *cfg.packet_budget_bytes < Message::HEADER_BYTES) {
    err = "packet_budget_bytes_too_small"; return false;
  }
  return true;
}

// parse_config_json() — overlay onto a scratch copy; commit only if all good.
bool parse_config_json(const std::string& text, ReliableOrderedConfig& cfg, std::string& err) {
  const json doc = json::parse(text, nullptr, /*allow_exceptions*/false);
  if (doc.is_discarded()) { err = "json_parse_error"; return false; }
  if (!doc.is_object())   { err = "json_not_object";  return false; }

  ReliableOrderedConfig next = cfg;

  uint64_t sent_packets = next.sent_packet_buffer_size;
  uint64_t send_queue   = next.message_send_queue_size;
  uint64_t recv_queue   = next.message_receive_queue_size;
  uint64_t per_packet   = next.max_message_per_packet;
  uint64_t resend_ms    = next.message_resend_time_ms;

  if (!read_unsigned(doc, "sent_packet_buffer_size",    sent_packets, err)) return false;
  if (!read_unsigned(doc, "message_send_queue_size",    send_queue,   err)) return false;
  if (!read_unsigned(doc, "message_receive_queue_size", recv_queue,   err)) return false;
  if (!read_unsigned(doc, "max_message_per_packet",     per_packet,   err)) return false;
  if (!read_unsigned(doc, "message_resend_time_ms",     resend_ms,    err)) return false;

  // packet_budget_bytes: null clears it, a number sets it.
  auto budget = doc.find("packet_budget_bytes");
  if (budget != doc.end()) {
    if (budget->is_null()) {
      next.packet_budget_bytes.reset();
    } else if (budget->is_number_unsigned() && budget->get<uint64_t>() <= UINT32_MAX) {
      next.packet_budget_bytes = static_cast<uint32_t>(budget->get<uint64_t>());
    } else {
      err = "packet_budget_bytes_not_unsigned";
      return false;
    }
  }

  if (per_packet > UINT32_MAX) { err = "max_message_per_packet_out_of_range"; return false; }

  next.sent_packet_buffer_size    = static_cast<size_t>(sent_packets);
  next.message_send_queue_size    = static_cast<size_t>(send_queue);
  next.message_receive_queue_size = static_cast<size_t>(recv_queue);
  next.max_message_per_packet     = static_cast<uint32_t>(per_packet);
  next.message_resend_time_ms     = static_cast<TimeMs>(resend_ms);

  if (!validate(next, err)) return false;

  cfg = next;
  return true;
}

bool load_config_json(const std::string& path, ReliableOrderedConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "config_open_failed"; return false; }

  std::ostringstream buf;
  buf << in.rdbuf();
  return parse_config_json(buf.str(), cfg, err);
}

std::string config_to_json(const ReliableOrderedConfig& cfg) {
  json j;
  j["sent_packet_buffer_size"]    = cfg.sent_packet_buffer_size;
  j["message_send_queue_size"]    = cfg.message_send_queue_size;
  j["message_receive_queue_size"] = cfg.message_receive_queue_size;
  j["max_message_per_packet"]     = cfg.max_message_per_packet;
  if (cfg.packet_budget_bytes) j["packet_budget_bytes"] = *cfg.packet_budget_bytes;
  else                         j["packet_budget_bytes"] = nullptr;
  j["message_resend_time_ms"]     = cfg.message_resend_time_ms;
  return j.dump(2);
}

} // namespace ordlink
