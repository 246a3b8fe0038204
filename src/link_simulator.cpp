// -----------------------------------------------------------------------------
// link_simulator.cpp — Implementation of ordlink::LinkSimulator
//
// API & behavior: see include/ordlink/link_simulator.hpp
// -----------------------------------------------------------------------------
#include "ordlink/link_simulator.hpp"

#include <algorithm>
#include <utility>

namespace ordlink {

LinkSimulator::LinkSimulator(const LinkConfig& config, uint64_t seed)
: config_(config), rng_state_(seed) {
  entries_.reserve(config_.max_in_flight);     // the only allocation for bookkeeping
}

// simple LCG; upper bits are the usable ones
uint32_t LinkSimulator::next_random() {
  rng_state_ = rng_state_ * 6364136223846793005ull + 1;
  return static_cast<uint32_t>(rng_state_ >> 33);
}

float LinkSimulator::random_percent() {
  return static_cast<float>(next_random() % 10000) / 100.0f;
}

TimeMs LinkSimulator::delivery_time(TimeMs now_ms) {
  int64_t delay = config_.latency_ms;
  if (config_.jitter_ms > 0) {
    const uint32_t span = 2 * config_.jitter_ms + 1;
    delay += static_cast<int64_t>(next_random() % span) - static_cast<int64_t>(config_.jitter_ms);
  }
  if (delay < 0) delay = 0;                    // jitter never delivers into the past
  return now_ms + static_cast<TimeMs>(delay);
}

void LinkSimulator::schedule(const std::vector<uint8_t>& bytes, TimeMs now_ms) {
  if (entries_.size() >= config_.max_in_flight) {
    ++counters_.overflowed;
    return;
  }
  Entry e;
  e.deliver_at = delivery_time(now_ms);
  e.order      = next_order_++;
  e.bytes      = bytes;
  entries_.push_back(std::move(e));
}

// -----------------------------------------------------------------------------
// send() — Loss roll first; survivors are scheduled and may get one duplicate.
// NOTE: the duplicate roll happens only for packets that survived loss.
// -----------------------------------------------------------------------------
void LinkSimulator::send(const std::vector<uint8_t>& bytes, TimeMs now_ms) {
  ++counters_.sent;

  if (random_percent() < config_.packet_loss_percent) {
    ++counters_.dropped;
    return;
  }

  schedule(bytes, now_ms);

  if (random_percent() < config_.duplicate_percent) {
    ++counters_.duplicated;
    schedule(bytes, now_ms);
  }
}

bool LinkSimulator::receive(TimeMs now_ms, std::vector<std::vector<uint8_t>>& out) {
  // Partition due entries to the back, then hand them out in (time, order).
  auto first_due = std::stable_partition(entries_.begin(), entries_.end(),
                                         [now_ms](const Entry& e) { return e.deliver_at > now_ms; });
  if (first_due == entries_.end()) return false;

  std::sort(first_due, entries_.end(), [](const Entry& a, const Entry& b) {
    if (a.deliver_at != b.deliver_at) return a.deliver_at < b.deliver_at;
    return a.order < b.order;
  });

  for (auto it = first_due; it != entries_.end(); ++it) {
    out.push_back(std::move(it->bytes));
    ++counters_.delivered;
  }
  entries_.erase(first_due, entries_.end());
  return true;
}

} // namespace ordlink
