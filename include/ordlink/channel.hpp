#pragma once
/**
 * @file channel.hpp
 * @brief The channel contract every ordlink channel kind implements.
 *
 * @details
 * A connection layer owns sockets, packet framing and packet-level acks. It
 * talks to each of its channels through this interface only, so it never
 * needs to know which delivery guarantees a channel provides:
 *
 * ```
 *   [app] --send_message()-->  Channel  --get_messages_to_send()--> [packet out]
 *   [app] <-receive_message()- Channel  <--process_messages()------ [packet in]
 *                              Channel  <--process_ack(seq)-------- [transport ack]
 *                              Channel  <--update_current_time()--- [tick]
 * ```
 *
 * Channels are created from a `ChannelConfig`, which acts as the factory for
 * its kind. Only the reliable-ordered kind ships in this library
 * (reliable_ordered_channel.hpp).
 *
 * Contract shared by all kinds:
 *  - Single owner, synchronous, no locks, no I/O, no wall clock.
 *  - Time moves only when the owner calls update_current_time().
 *  - "Nothing to send" / "nothing to receive" are `false` returns, not errors.
 *  - error() is sticky until reset().
 */

#include <stdint.h>
#include <memory>
#include <optional>

#include "ordlink/message.hpp"

namespace ordlink {

/// Logical time in milliseconds. Supplied by the owner, never read from a clock.
using TimeMs = uint64_t;

// Result codes kept small and explicit.
enum class SendResult : uint8_t { Ok=0, QueueFull=1, TooLarge=2 };
enum class ChannelError : uint8_t { None=0, Desync=1 };

/// @brief Short token for logs ("ok", "queue_full", "too_large").
const char* to_string(SendResult r);

/// @brief Short token for logs ("none", "desync").
const char* to_string(ChannelError e);

/// Running totals, zeroed on construction and on reset().
struct ChannelCounters {
  uint64_t messages_sent{0};       ///< Accepted by send_message().
  uint64_t messages_received{0};   ///< Handed to the application by receive_message().
  uint64_t messages_resent{0};     ///< Selections of a message that had been sent before.
  uint64_t messages_acked{0};      ///< Removed from the send queue by an ack.
  uint64_t messages_rejected{0};   ///< Refused by send_message() (queue full / too large).
  uint64_t messages_stale{0};      ///< Arrivals older than the receive cursor (already delivered).
  uint64_t messages_duplicate{0};  ///< Arrivals already waiting in the receive queue.
};

/**
 * @brief Capability set of a channel, as seen by the connection layer.
 */
class Channel {
public:
  virtual ~Channel() = default;

  /// Advance the channel's logical clock.
  virtual void update_current_time(TimeMs now_ms) = 0;

  /**
   * @brief Pick the messages that should ride in the packet being built.
   *
   * @param available_bits  Room left in the packet, or nullopt for "no limit
   *                        from the caller" (a configured budget still applies).
   * @param packet_sequence Transport sequence of the packet being built; the
   *                        matching process_ack() call uses the same value.
   * @param out             Replaced with the selected messages on success.
   * @retval true  At least one message was selected.
   * @retval false Nothing due or nothing fits; `out` is left untouched.
   */
  virtual bool get_messages_to_send(std::optional<uint32_t> available_bits,
                                    uint16_t packet_sequence,
                                    MessageList& out) = 0;

  /// Hand over the messages the peer put in one packet.
  virtual void process_messages(MessageList messages) = 0;

  /// The transport confirmed delivery of `packet_sequence`.
  virtual void process_ack(uint16_t packet_sequence) = 0;

  /// Queue an application payload for delivery.
  virtual SendResult send_message(Payload payload) = 0;

  /// Pop the next deliverable payload. false if none is ready.
  virtual bool receive_message(Payload& out) = 0;

  /// True while sent messages still await acknowledgment.
  virtual bool has_messages_to_send() const = 0;

  /// Back to the freshly constructed state (clock excepted).
  virtual void reset() = 0;

  virtual const ChannelCounters& counters() const = 0;
  virtual ChannelError error() const = 0;
};

/**
 * @brief Configuration of one channel kind, and the factory for it.
 *
 * Concrete configs are plain value types with defaults; new_channel() builds
 * a channel of that kind with a copy of the config.
 */
class ChannelConfig {
public:
  virtual ~ChannelConfig() = default;
  virtual std::unique_ptr<Channel> new_channel(TimeMs now_ms) const = 0;
};

} // namespace ordlink
