/**
 * @file sequence_buffer.hpp
 * @brief SequenceBuffer<T> — fixed-capacity store indexed by 16-bit sequence number.
 *
 * @details
 * ## What it is
 * A ring of `capacity` slots. Sequence `s` lives in slot `s % capacity`, and
 * every slot also remembers the *exact* sequence currently stored there. That
 * tag is what lets `get()` tell "this slot holds 1029" apart from "this slot
 * holds 5" when both map to the same index.
 *
 * ```
 *  capacity = 1024
 *
 *  index      0        1        2     ...    904    ...   1023
 *  tag      1024    (empty)     2           50000        (empty)
 *  value     m1               m2             m3
 *
 *  get(1024) -> m1     get(0) -> nullptr (slot 0 holds 1024, not 0)
 * ```
 *
 * ## Aging by aliasing
 * There is no explicit eviction. Inserting `s` overwrites whatever occupied
 * `s % capacity`, acknowledged or not, with no signal to the caller.
 * Owners must size the buffer larger than their in-flight window, or enforce
 * that window themselves (the reliable-ordered channel does both).
 *
 * ## Memory
 * Both arrays are allocated once in the constructor. insert/get/exists/remove
 * never allocate (beyond what moving a `T` into a slot does on its own).
 *
 * ## Complexity
 * Every operation is O(1). `reset()` is O(capacity).
 *
 * Not thread-safe. One owner drives it.
 */
#ifndef ORDLINK_SEQUENCE_BUFFER_HPP
#define ORDLINK_SEQUENCE_BUFFER_HPP

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <utility>
#include <vector>

#include "ordlink/sequence.hpp"

namespace ordlink {

template <typename T>
class SequenceBuffer {
public:
  /// Tag value meaning "no entry in this slot". Outside the 16-bit id range on purpose.
  static constexpr uint32_t EMPTY_SLOT = 0xFFFFFFFFu;

  /**
   * @brief Allocate `capacity` empty slots.
   * @param capacity Number of slots. Zero is bumped to one.
   */
  explicit SequenceBuffer(size_t capacity)
  : capacity_(capacity ? capacity : 1),
    entry_sequence_(capacity_, EMPTY_SLOT),
    entries_(capacity_) {}

  SequenceBuffer(const SequenceBuffer&) = delete;
  SequenceBuffer& operator=(const SequenceBuffer&) = delete;

  /**
   * @brief Store `value` under `sequence`, replacing any slot occupant.
   *
   * The high-water mark moves to `sequence + 1` when `sequence` is newer
   * than everything inserted so far.
   *
   * @return Pointer to the stored value (valid until the slot is reused or removed).
   */
  T* insert(uint16_t sequence, T value) {
    const uint16_t next = static_cast<uint16_t>(sequence + 1);
    if (!has_inserted_ || sequence_greater_than(next, high_water_)) {
      high_water_   = next;
      has_inserted_ = true;
    }
    const size_t index = index_of(sequence);
    entry_sequence_[index] = sequence;
    entries_[index] = std::move(value);
    return &entries_[index];
  }

  /// @brief Value stored under exactly `sequence`, or nullptr.
  T* get(uint16_t sequence) {
    const size_t index = index_of(sequence);
    return entry_sequence_[index] == sequence ? &entries_[index] : nullptr;
  }

  /// @brief Read-only variant of get().
  const T* get(uint16_t sequence) const {
    const size_t index = index_of(sequence);
    return entry_sequence_[index] == sequence ? &entries_[index] : nullptr;
  }

  /// @brief True if the slot for `sequence` holds exactly `sequence`.
  bool exists(uint16_t sequence) const {
    return entry_sequence_[index_of(sequence)] == sequence;
  }

  /**
   * @brief Remove and return the value stored under exactly `sequence`.
   * @return The removed value, or std::nullopt if `sequence` is not stored
   *         (the slot is empty or holds a different sequence).
   */
  std::optional<T> remove(uint16_t sequence) {
    const size_t index = index_of(sequence);
    if (entry_sequence_[index] != sequence) return std::nullopt;
    std::optional<T> out(std::move(entries_[index]));
    entries_[index] = T{};                 // release whatever the moved-from value still owns
    entry_sequence_[index] = EMPTY_SLOT;
    return out;
  }

  /**
   * @brief One past the newest sequence inserted so far (0 before any insert).
   *
   * For a producer that inserts 0, 1, 2, ... this is the next id it will
   * use, which makes it the natural stop point for forward scans.
   */
  uint16_t high_water() const { return high_water_; }

  /// @brief Empty every slot and forget the high-water mark.
  void reset() {
    for (size_t i = 0; i < capacity_; ++i) {
      entry_sequence_[i] = EMPTY_SLOT;
      entries_[i] = T{};
    }
    high_water_   = 0;
    has_inserted_ = false;
  }

  size_t capacity() const { return capacity_; }

private:
  size_t index_of(uint16_t sequence) const { return sequence % capacity_; }

  size_t                capacity_;
  uint16_t              high_water_{0};
  bool                  has_inserted_{false};
  std::vector<uint32_t> entry_sequence_;   ///< Exact id per slot; EMPTY_SLOT when free. Kept apart from entries_ for cache-friendly lookups.
  std::vector<T>        entries_;
};

} // namespace ordlink

#endif // ORDLINK_SEQUENCE_BUFFER_HPP
