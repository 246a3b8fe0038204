/**
 * @file sequence.hpp
 * @brief Wraparound-aware arithmetic for 16-bit message and packet ids.
 *
 * @details
 * Every id in ordlink (message ids, packet sequences) is a `uint16_t` that
 * wraps from 65535 back to 0. Plain `<` is wrong near the wrap: 65535 was
 * sent *before* 0, not after. These helpers compare ids in "half space":
 * `a` is newer than `b` when the forward distance from `b` to `a` is at most
 * half the id space (32768).
 *
 * | a     | b     | sequence_greater_than(a, b) |
 * |-------|-------|-----------------------------|
 * | 1     | 0     | true                        |
 * | 0     | 65535 | true  (wrapped)             |
 * | 65535 | 0     | false                       |
 * | 40000 | 0     | false (more than half away) |
 *
 * @note Results are only meaningful while the two ids being compared are
 *       within 32768 of each other. Queue capacities are validated against
 *       that bound (see channel_config_file.hpp).
 */
#ifndef ORDLINK_SEQUENCE_HPP
#define ORDLINK_SEQUENCE_HPP

#include <stdint.h>

namespace ordlink {

/// Half of the 16-bit id space; the largest distance the comparisons can order.
static constexpr uint16_t SEQUENCE_HALF_RANGE = 32768;

/// @brief True if `s1` is newer than `s2`, accounting for wraparound.
inline bool sequence_greater_than(uint16_t s1, uint16_t s2) {
  return ((s1 > s2) && (s1 - s2 <= SEQUENCE_HALF_RANGE)) ||
         ((s1 < s2) && (s2 - s1 >  SEQUENCE_HALF_RANGE));
}

/// @brief True if `s1` is older than `s2`, accounting for wraparound.
inline bool sequence_less_than(uint16_t s1, uint16_t s2) {
  return sequence_greater_than(s2, s1);
}

/**
 * @brief Forward distance from `from` to `to`, modulo 65536.
 *
 * `sequence_distance(65534, 2) == 4`. An id "behind" `from` yields a large
 * value (close to 65536), which makes this the natural window test:
 * `sequence_distance(start, id) < window_size`.
 */
inline uint16_t sequence_distance(uint16_t from, uint16_t to) {
  return static_cast<uint16_t>(to - from);
}

} // namespace ordlink

#endif // ORDLINK_SEQUENCE_HPP
