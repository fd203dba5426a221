#pragma once

#include <atomic>
#include <cstdint>

namespace puid::core {

// SequenceCounter disambiguates IDs minted within the same clock tick.
//
// next() is a single lock-free read-modify-write: it returns the value observed
// before the increment and stores (value + 1) mod 256. From a fresh counter the
// first 256 calls return 0..255, the 257th returns 0 again. Concurrent callers
// never observe the same value within one wrap period.
class SequenceCounter {
 public:
  SequenceCounter() = default;
  explicit SequenceCounter(std::uint8_t initial) : value_(initial) {}
  ~SequenceCounter() = default;

  // Not copyable or movable (contains atomic counter)
  SequenceCounter(const SequenceCounter&) = delete;
  SequenceCounter& operator=(const SequenceCounter&) = delete;
  SequenceCounter(SequenceCounter&&) = delete;
  SequenceCounter& operator=(SequenceCounter&&) = delete;

  std::uint8_t next();

  // Snapshot of the value the next call will return. Diagnostics only.
  [[nodiscard]] std::uint8_t peek() const;

 private:
  std::atomic<std::uint8_t> value_{0};
};

// process_sequence_counter returns the counter shared by every generator that does
// not bring its own. Initialised on first use, lives for the process lifetime.
SequenceCounter& process_sequence_counter();

}  // namespace puid::core
