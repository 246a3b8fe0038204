#pragma once
/**
 * @file link_simulator.hpp
 * @brief Deterministic lossy link: drops, delays, jitters and duplicates packets.
 *
 * @details
 * Reliable delivery code is only as good as the worst network it was tested
 * on. This simulator stands in for the transport during tests and soak runs:
 *
 * ```
 *  send(bytes, now) ──► loss roll ──► drop
 *                          │
 *                          ├─► deliver_at = now + latency ± jitter
 *                          └─► duplicate roll ──► second copy, own jitter
 *
 *  receive(now, out) ◄── every packet with deliver_at <= now,
 *                        earliest first, ties in send order
 * ```
 *
 * Jitter alone already reorders packets. Latency is one-way; configure each
 * direction separately if you want an asymmetric link.
 *
 * Determinism: all randomness comes from a small LCG seeded in the
 * constructor. Same seed, same calls, same outcome.
 *
 * Capacity: at most `max_in_flight` packets are buffered. A send (or
 * duplicate) that finds the buffer full is dropped and counted as overflow.
 */

#include <stdint.h>
#include <stddef.h>
#include <vector>

#include "ordlink/channel.hpp"

namespace ordlink {

struct LinkConfig {
  uint32_t latency_ms{0};             ///< One-way base delay.
  uint32_t jitter_ms{0};              ///< Uniform +/- spread around latency (never before now).
  float    packet_loss_percent{0.0f}; ///< 0..100
  float    duplicate_percent{0.0f};   ///< 0..100, chance of one extra copy
  size_t   max_in_flight{1024};       ///< Buffered packet limit.
};

struct LinkCounters {
  uint64_t sent{0};        ///< send() calls
  uint64_t dropped{0};     ///< lost to packet_loss_percent
  uint64_t duplicated{0};  ///< extra copies scheduled
  uint64_t delivered{0};   ///< handed out by receive()
  uint64_t overflowed{0};  ///< lost because the buffer was full
};

class LinkSimulator {
public:
  LinkSimulator(const LinkConfig& config, uint64_t seed);

  /// Offer one packet to the link at time `now_ms`.
  void send(const std::vector<uint8_t>& bytes, TimeMs now_ms);

  /**
   * @brief Append every packet due at `now_ms` to `out`.
   * @return true if at least one packet was appended.
   */
  bool receive(TimeMs now_ms, std::vector<std::vector<uint8_t>>& out);

  size_t in_flight() const { return entries_.size(); }
  const LinkCounters& counters() const { return counters_; }
  const LinkConfig& config() const { return config_; }

private:
  struct Entry {
    TimeMs               deliver_at{0};
    uint64_t             order{0};     ///< send order, breaks delivery-time ties
    std::vector<uint8_t> bytes;
  };

  uint32_t next_random();
  float    random_percent();           ///< [0, 100)
  TimeMs   delivery_time(TimeMs now_ms);
  void     schedule(const std::vector<uint8_t>& bytes, TimeMs now_ms);

  LinkConfig         config_;
  uint64_t           rng_state_;
  uint64_t           next_order_{0};
  std::vector<Entry> entries_;
  LinkCounters       counters_{};
};

} // namespace ordlink
