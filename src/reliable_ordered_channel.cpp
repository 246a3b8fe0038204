// -----------------------------------------------------------------------------
// reliable_ordered_channel.cpp — Implementation of ordlink::ReliableOrderedChannel
//
// API & field descriptions:
//   see include/ordlink/reliable_ordered_channel.hpp
//
// Runnable usage:
//   see tests/test_reliable_ordered_channel.cpp, tests/test_channel_delivery.cpp
//   and the soak driver in cli/main.cpp.
//
// This file covers the internal policies: how candidates are chosen, how
// the budget is charged, how acks collapse the in-flight window, and how
// arrivals are screened against the receive window.
// -----------------------------------------------------------------------------
#include "ordlink/reliable_ordered_channel.hpp"
#include "ordlink/sequence.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace ordlink {

namespace {

constexpr uint32_t UNBOUNDED_BITS = std::numeric_limits<uint32_t>::max();

size_t clamp_capacity(size_t n) {
  return std::min(std::max<size_t>(n, 1), MAX_QUEUE_CAPACITY);
}

// Copy of `in` with every size forced into its legal range.
ReliableOrderedConfig sanitized(const ReliableOrderedConfig& in) {
  ReliableOrderedConfig out = in;
  out.sent_packet_buffer_size    = clamp_capacity(in.sent_packet_buffer_size);
  out.message_send_queue_size    = clamp_capacity(in.message_send_queue_size);
  out.message_receive_queue_size = clamp_capacity(in.message_receive_queue_size);
  out.max_message_per_packet     = std::min<uint32_t>(
      std::max<uint32_t>(in.max_message_per_packet, 1),
      static_cast<uint32_t>(MAX_MESSAGES_PER_PACKET_LIMIT));
  return out;
}

} // namespace

// ---------- factory ----------

std::unique_ptr<Channel> ReliableOrderedConfig::new_channel(TimeMs now_ms) const {
  return std::make_unique<ReliableOrderedChannel>(now_ms, *this);
}

// ---------- construction ----------

ReliableOrderedChannel::ReliableOrderedChannel(TimeMs now_ms, const ReliableOrderedConfig& config)
: config_(sanitized(config)),
  packets_sent_(config_.sent_packet_buffer_size),
  messages_send_(config_.message_send_queue_size),
  messages_received_(config_.message_receive_queue_size),
  current_time_(now_ms) {}

void ReliableOrderedChannel::update_current_time(TimeMs now_ms) {
  current_time_ = now_ms;               // logical clock; no monotonic guard, owner is trusted
}

// ---------- send side ----------

bool ReliableOrderedChannel::has_messages_to_send() const {
  return oldest_unacked_message_id_ != send_message_id_;
}

bool ReliableOrderedChannel::can_send_message() const {
  // In-flight ids occupy [oldest_unacked, send_id). One more would make the
  // window as wide as the buffer and alias the oldest unacked entry.
  return sequence_distance(oldest_unacked_message_id_, send_message_id_)
         < config_.message_send_queue_size;
}

// -----------------------------------------------------------------------------
// send_message() — Stage a payload under the next message id.
// POLICY:
//   - Size checks first, capacity second; a rejected payload consumes no id.
//   - Wire size is computed once here and cached for every later selection.
// OUT:
//   - One OutboundEntry with no send time; counters_.messages_sent++.
// -----------------------------------------------------------------------------
SendResult ReliableOrderedChannel::send_message(Payload payload) {
  if (payload.size() > Message::MAX_PAYLOAD_BYTES) {
    ++counters_.messages_rejected;
    return SendResult::TooLarge;
  }

  const uint32_t size_bits = static_cast<uint32_t>(serialized_size_bytes(payload.size()) * 8);
  if (size_bits > configured_budget_bits()) {    // could never be selected
    ++counters_.messages_rejected;
    return SendResult::TooLarge;
  }

  if (!can_send_message()) {
    ++counters_.messages_rejected;
    return SendResult::QueueFull;
  }

  const uint16_t message_id = send_message_id_;
  send_message_id_ = static_cast<uint16_t>(send_message_id_ + 1);   // wraps at 65536

  OutboundEntry entry;
  entry.message              = Message(message_id, std::move(payload));
  entry.serialized_size_bits = size_bits;
  messages_send_.insert(message_id, std::move(entry));

  ++counters_.messages_sent;
  return SendResult::Ok;
}

// -----------------------------------------------------------------------------
// get_messages_to_send() — Fill one packet's worth of due messages.
// PRE:   Caller is building packet `packet_sequence`.
// POLICY:
//   - Scan from oldest_unacked over min(send, receive) queue sizes.
//   - Due = never sent, or last_send_time + resend_time <= now.
//   - Too big for what is left? Skip it and keep scanning.
//   - Stop at max_message_per_packet selections.
// OUT:
//   - Selected entries stamped with now; ids recorded under packet_sequence.
//   - `out` replaced only when something was selected.
// -----------------------------------------------------------------------------
bool ReliableOrderedChannel::get_messages_to_send(std::optional<uint32_t> available_bits,
                                                  uint16_t packet_sequence,
                                                  MessageList& out) {
  if (!has_messages_to_send()) return false;

  uint32_t budget = effective_budget_bits(available_bits);

  const size_t message_limit = std::min(config_.message_send_queue_size,
                                        config_.message_receive_queue_size);

  PacketMessageIds ids;
  MessageList selected;

  for (size_t i = 0; i < message_limit; ++i) {
    if (ids.size() == config_.max_message_per_packet) break;

    const uint16_t message_id = static_cast<uint16_t>(oldest_unacked_message_id_ + i);
    OutboundEntry* entry = messages_send_.get(message_id);
    if (!entry) continue;                                  // acked already, or a gap
    if (!is_due(*entry)) continue;                         // sent recently; wait
    if (entry->serialized_size_bits > budget) continue;    // does not fit; try smaller ones

    if (entry->last_send_time) ++counters_.messages_resent;
    entry->last_send_time = current_time_;
    budget -= entry->serialized_size_bits;

    ids.push_back(message_id);
    selected.push_back(entry->message);                    // copy; the entry stays until acked
  }

  if (ids.empty()) return false;

  SentPacketRecord record;
  record.message_ids = ids;
  packets_sent_.insert(packet_sequence, std::move(record));

  out = std::move(selected);
  return true;
}

// -----------------------------------------------------------------------------
// process_ack() — Turn a packet-level ack into message-level acks.
// POLICY:
//   - Unknown / overwritten / already-acked record: nothing to do.
//   - Every listed id still queued is removed (first ack wins).
//   - Then collapse the window from the left.
// -----------------------------------------------------------------------------
void ReliableOrderedChannel::process_ack(uint16_t packet_sequence) {
  SentPacketRecord* record = packets_sent_.get(packet_sequence);
  if (!record || record->acknowledged) return;

  record->acknowledged = true;

  for (uint16_t message_id : record->message_ids) {
    if (messages_send_.remove(message_id)) {
      ++counters_.messages_acked;
    }
  }

  update_oldest_unacked();
}

// -----------------------------------------------------------------------------
// update_oldest_unacked() — Advance the left edge past removed ids.
// POLICY:
//   - Stop at the send frontier (high-water of the send buffer) or at the
//     first id still queued. Gaps to the right of a queued id stay until
//     that id is acked.
// -----------------------------------------------------------------------------
void ReliableOrderedChannel::update_oldest_unacked() {
  const uint16_t stop_id = messages_send_.high_water();

  while (oldest_unacked_message_id_ != stop_id &&
         !messages_send_.exists(oldest_unacked_message_id_)) {
    oldest_unacked_message_id_ = static_cast<uint16_t>(oldest_unacked_message_id_ + 1);
  }
}

// ---------- receive side ----------

// -----------------------------------------------------------------------------
// process_messages() — Stage arrivals from the peer.
// POLICY (per message, first match wins):
//   - older than receive cursor   -> stale, drop (resend after a lost ack)
//   - at/after cursor + capacity  -> Desync, stop; would alias a staged entry
//   - already staged              -> duplicate, drop
//   - otherwise                   -> stage
// -----------------------------------------------------------------------------
void ReliableOrderedChannel::process_messages(MessageList messages) {
  if (error_ != ChannelError::None) return;

  for (Message& message : messages) {
    if (sequence_less_than(message.id, receive_message_id_)) {
      ++counters_.messages_stale;
      continue;
    }

    if (sequence_distance(receive_message_id_, message.id) >= config_.message_receive_queue_size) {
      error_ = ChannelError::Desync;
      return;
    }

    if (messages_received_.exists(message.id)) {
      ++counters_.messages_duplicate;
      continue;
    }

    const uint16_t message_id = message.id;
    messages_received_.insert(message_id, std::move(message));
  }
}

bool ReliableOrderedChannel::receive_message(Payload& out) {
  std::optional<Message> message = messages_received_.remove(receive_message_id_);
  if (!message) return false;          // next id not here yet; later ids keep waiting

  receive_message_id_ = static_cast<uint16_t>(receive_message_id_ + 1);
  ++counters_.messages_received;

  out = std::move(message->payload);
  return true;
}

// ---------- lifecycle ----------

void ReliableOrderedChannel::reset() {
  packets_sent_.reset();
  messages_send_.reset();
  messages_received_.reset();

  send_message_id_           = 0;
  receive_message_id_        = 0;
  oldest_unacked_message_id_ = 0;

  counters_ = ChannelCounters{};
  error_    = ChannelError::None;
}

// ---------- private helpers ----------

uint32_t ReliableOrderedChannel::configured_budget_bits() const {
  if (!config_.packet_budget_bytes) return UNBOUNDED_BITS;
  const uint64_t bits = static_cast<uint64_t>(*config_.packet_budget_bytes) * 8;
  return bits > UNBOUNDED_BITS ? UNBOUNDED_BITS : static_cast<uint32_t>(bits);
}

uint32_t ReliableOrderedChannel::effective_budget_bits(std::optional<uint32_t> available_bits) const {
  const uint32_t caller = available_bits ? *available_bits : UNBOUNDED_BITS;
  return std::min(configured_budget_bits(), caller);
}

bool ReliableOrderedChannel::is_due(const OutboundEntry& entry) const {
  if (!entry.last_send_time) return true;
  // elapsed form: last + resend can overflow for huge intervals
  if (current_time_ < *entry.last_send_time) return false;
  return current_time_ - *entry.last_send_time >= config_.message_resend_time_ms;
}

} // namespace ordlink
