#include "puid/core/sequence_counter.h"

namespace puid::core {

std::uint8_t SequenceCounter::next() {
  // Unsigned 8-bit fetch_add wraps 255 -> 0.
  return value_.fetch_add(1, std::memory_order_relaxed);
}

std::uint8_t SequenceCounter::peek() const {
  return value_.load(std::memory_order_relaxed);
}

SequenceCounter& process_sequence_counter() {
  static SequenceCounter counter;
  return counter;
}

}  // namespace puid::core
