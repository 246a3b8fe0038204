/**
 * @file reliable_ordered_channel.hpp
 * @brief ordlink ReliableOrderedChannel — exactly-once, in-order messages over a lossy packet link.
 *
 * @details
 * ## Field Brief
 * The packet link underneath drops, duplicates and reorders. The application
 * above wants every message once, in the order it was sent. This channel sits
 * between the two. It does not know sockets or wire framing; the connection
 * layer hands it packet sequences, acks and message lists, and it decides
 * what goes out, what gets resent, and what the application may read next.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [Application]                 [ReliableOrderedChannel]                 [Connection]
 *       │                                   │                                   │
 *  send_message(p) ──► messages_send_ (SequenceBuffer<OutboundEntry>)          │
 *       │                                   │                                   │
 *       │            get_messages_to_send(bits, seq) ◄── build packet ──────────┤
 *       │                 ├─ scan from oldest_unacked_id_                       │
 *       │                 ├─ due?  never sent, or resend time elapsed           │
 *       │                 ├─ fits? size <= remaining budget (else skip)         │
 *       │                 └─ record ids in sent_packets_[seq]                   │
 *       │                                   │                                   │
 *       │            process_ack(seq) ◄──────────── transport ack ──────────────┤
 *       │                 ├─ drop acked ids from messages_send_                 │
 *       │                 └─ walk oldest_unacked_id_ forward                    │
 *       │                                   │                                   │
 *       │            process_messages(list) ◄────── packet from peer ───────────┤
 *       │                 └─ stage into messages_received_ (window-checked)     │
 *       │                                   │                                   │
 *  receive_message() ◄── pops exactly receive_id_, then receive_id_++           │
 * ```
 *
 * ---
 *
 * @par Design Constraints & Trade-offs
 * - **Time-driven resend only.** No NACKs. An unacked message becomes due
 *   again `message_resend_time_ms` after it was last put in a packet.
 * - **Fixed memory.** Three SequenceBuffers sized from the config at
 *   construction. Nothing grows afterwards.
 * - **Skip, don't stop.** A due message that does not fit the remaining
 *   budget is skipped so smaller later messages can still fill the packet.
 * - **16-bit ids.** Message ids and packet sequences wrap at 65536. Window
 *   checks use the half-space helpers in sequence.hpp.
 *
 * ---
 *
 * @par Failure Model
 * - **Send queue full:** send_message() returns SendResult::QueueFull and
 *   stores nothing. The alternative, overwriting the oldest unacked message,
 *   would break delivery silently. Caller decides: retry later, drop, or
 *   back-pressure.
 * - **Message too large:** SendResult::TooLarge when the payload has no wire
 *   form (>65535 bytes) or could never fit the configured packet budget.
 * - **Stale arrival** (id already delivered): dropped, counted. These are
 *   normal: a resend whose ack was lost.
 * - **Duplicate arrival** (id already staged): dropped, counted.
 * - **Arrival beyond the receive window:** the channel flags
 *   ChannelError::Desync and ignores further input until reset(). It means
 *   the peers disagree about ids, or the application stopped draining.
 * - **Lost ack:** nothing special; the message is resent after the interval
 *   and the receiver drops the copy as stale.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * ordlink::ReliableOrderedConfig cfg;            // defaults: 1024/1024/1024/256/none/100ms
 * auto ch = cfg.new_channel(now_ms);
 *
 * ch->send_message(bytes);
 *
 * // per tick, per outgoing packet:
 * ch->update_current_time(now_ms);
 * ordlink::MessageList out;
 * if (ch->get_messages_to_send(std::nullopt, packet_seq, out)) {
 *   // serialize `out` into packet `packet_seq`
 * }
 *
 * // when the transport learns packet_seq arrived:
 * ch->process_ack(packet_seq);
 *
 * // when a packet from the peer arrives:
 * ch->process_messages(std::move(messages_from_packet));
 * ordlink::Payload p;
 * while (ch->receive_message(p)) { deliver(p); }
 * @endcode
 */
#ifndef ORDLINK_RELIABLE_ORDERED_CHANNEL_HPP
#define ORDLINK_RELIABLE_ORDERED_CHANNEL_HPP

#include <stdint.h>
#include <stddef.h>
#include <memory>
#include <optional>

#include "etl/vector.h"
#include "ordlink/channel.hpp"
#include "ordlink/message.hpp"
#include "ordlink/sequence_buffer.hpp"

namespace ordlink {

/**
 * @brief Hard ceiling for `max_message_per_packet`.
 *
 * @details
 * Each sent-packet record keeps its message ids in a fixed-capacity ETL
 * vector of this size, so per-packet bookkeeping never touches the heap.
 */
static constexpr size_t MAX_MESSAGES_PER_PACKET_LIMIT = 256;

/**
 * @brief Largest queue capacity accepted.
 *
 * @details
 * Half the id space. Beyond that, wraparound comparisons can no longer tell
 * "ahead" from "behind" inside a window.
 */
static constexpr size_t MAX_QUEUE_CAPACITY = 32768;

/**
 * @brief Settings for a reliable-ordered channel; also its factory.
 *
 * Defaults match a typical realtime link: 1024-entry buffers, up to 256
 * messages per packet, no byte budget, resend after 100 ms.
 */
struct ReliableOrderedConfig : public ChannelConfig {
  /**
   * @brief Sent-packet records kept for ack lookup.
   *
   * Should cover a few seconds of packets at your send rate. An ack for a
   * packet whose record was already overwritten is ignored; its messages are
   * simply resent later.
   */
  size_t   sent_packet_buffer_size{1024};

  /// Max messages in flight (sent, not yet acked). send_message() refuses beyond this.
  size_t   message_send_queue_size{1024};

  /// Max messages staged on the receive side ahead of the application.
  size_t   message_receive_queue_size{1024};

  /// Max messages bundled into one packet (1..MAX_MESSAGES_PER_PACKET_LIMIT).
  uint32_t max_message_per_packet{256};

  /// Per-packet byte ceiling for this channel. nullopt = bounded only by the caller.
  std::optional<uint32_t> packet_budget_bytes;

  /// Minimum wait before an unacked message is put in a packet again.
  TimeMs   message_resend_time_ms{100};

  std::unique_ptr<Channel> new_channel(TimeMs now_ms) const override;
};

/**
 * @class ReliableOrderedChannel
 * @brief Send/ack/resend/receive state machine for one reliable-ordered stream.
 *
 * @details
 * Per message on the send side:
 * `Staged` (never sent) → `Sent(t)` when first selected → `Sent(t')` on each
 * timeout-driven resend → removed on the first ack of any packet carrying it.
 *
 * All state is owned by the instance. Independent instances can be driven
 * from different threads; a single instance must not be.
 */
class ReliableOrderedChannel : public Channel {
public:
  /**
   * @brief Build a channel with buffers sized from `config`.
   *
   * @details
   * Out-of-range sizes are clamped rather than rejected (capacities to
   * 1..MAX_QUEUE_CAPACITY, messages per packet to
   * 1..MAX_MESSAGES_PER_PACKET_LIMIT). Use validate() from
   * channel_config_file.hpp first if you want to be told instead.
   *
   * @param now_ms Initial logical time.
   * @param config Settings; copied.
   */
  ReliableOrderedChannel(TimeMs now_ms, const ReliableOrderedConfig& config);

  void update_current_time(TimeMs now_ms) override;

  /**
   * @brief Select due messages for the packet `packet_sequence`.
   *
   * @details
   * Budget is the configured `packet_budget_bytes * 8` capped by
   * `available_bits` when both exist, whichever exists otherwise, unbounded
   * when neither does. Candidates are scanned from the oldest unacked id over
   * `min(send queue, receive queue)` ids, so the receiver's window is never
   * overrun. Scanning stops after `max_message_per_packet` selections.
   *
   * Selected messages get their last-send time stamped to now, and the id
   * list is recorded under `packet_sequence` for process_ack().
   *
   * @retval true  `out` holds the selected messages (never empty).
   * @retval false Nothing pending, nothing due, or nothing fits.
   */
  bool get_messages_to_send(std::optional<uint32_t> available_bits,
                            uint16_t packet_sequence,
                            MessageList& out) override;

  /**
   * @brief Stage messages received from the peer.
   *
   * @details
   * Stale and duplicate ids are dropped and counted. An id at or beyond
   * `receive cursor + message_receive_queue_size` puts the channel into
   * ChannelError::Desync; the remaining messages and all later calls are
   * ignored until reset().
   */
  void process_messages(MessageList messages) override;

  /**
   * @brief Apply a transport ack for `packet_sequence`.
   *
   * @details
   * Idempotent: unknown sequences, overwritten records and records already
   * acked are ignored. Otherwise every message listed in the record that is
   * still queued is removed, and the oldest-unacked cursor walks forward past
   * the ids that are now gone, stopping at the first still-queued id or at
   * the send frontier.
   */
  void process_ack(uint16_t packet_sequence) override;

  /**
   * @brief Queue `payload` for reliable delivery.
   *
   * @retval SendResult::Ok        Queued under the next message id.
   * @retval SendResult::QueueFull `message_send_queue_size` messages already await acks.
   * @retval SendResult::TooLarge  Payload has no wire form or exceeds the packet budget.
   *
   * Rejected payloads consume no id.
   */
  SendResult send_message(Payload payload) override;

  /**
   * @brief Pop the payload with the next expected id, if it has arrived.
   *
   * Later ids that already arrived stay staged until every earlier id has
   * been popped.
   */
  bool receive_message(Payload& out) override;

  /// True while some sent message is still unacked.
  bool has_messages_to_send() const override;

  /**
   * @brief Return to the just-constructed state.
   *
   * Clears all three buffers, zeroes the ids and counters, clears the error.
   * The logical clock keeps its current value.
   */
  void reset() override;

  const ChannelCounters& counters() const override { return counters_; }
  ChannelError error() const override { return error_; }

  /// @brief True if send_message() would accept a message of acceptable size now.
  bool can_send_message() const;

  /// @name Introspection (diagnostics and tests)
  ///@{
  const ReliableOrderedConfig& config() const { return config_; }
  TimeMs   current_time() const      { return current_time_; }
  uint16_t next_send_id() const      { return send_message_id_; }
  uint16_t next_receive_id() const   { return receive_message_id_; }
  uint16_t oldest_unacked_id() const { return oldest_unacked_message_id_; }
  ///@}

private:
  /// Message waiting for an ack, with its resend bookkeeping.
  struct OutboundEntry {
    Message               message;
    std::optional<TimeMs> last_send_time;         ///< nullopt until first selected
    uint32_t              serialized_size_bits{0};
  };

  using PacketMessageIds = etl::vector<uint16_t, MAX_MESSAGES_PER_PACKET_LIMIT>;

  /// Which message ids rode in one transport packet.
  struct SentPacketRecord {
    PacketMessageIds message_ids;
    bool             acknowledged{false};
  };

  /// Budget in bits for one selection pass.
  uint32_t effective_budget_bits(std::optional<uint32_t> available_bits) const;

  /// Budget configured on the channel alone, in bits (UINT32_MAX if none).
  uint32_t configured_budget_bits() const;

  /// True if `entry` may go out at the current time.
  bool is_due(const OutboundEntry& entry) const;

  /// Walk oldest_unacked_message_id_ past ids no longer queued.
  void update_oldest_unacked();

  ReliableOrderedConfig config_;

  SequenceBuffer<SentPacketRecord> packets_sent_;
  SequenceBuffer<OutboundEntry>    messages_send_;
  SequenceBuffer<Message>          messages_received_;

  uint16_t send_message_id_{0};             ///< Id the next send_message() assigns.
  uint16_t receive_message_id_{0};          ///< Id receive_message() waits for.
  uint16_t oldest_unacked_message_id_{0};   ///< Left edge of the in-flight window.

  TimeMs          current_time_{0};
  ChannelCounters counters_{};
  ChannelError    error_{ChannelError::None};
};

} // namespace ordlink

#endif // ORDLINK_RELIABLE_ORDERED_CHANNEL_HPP
