#include "puid/core/clock.h"

#include <chrono>

namespace puid::core {

std::uint64_t SystemClock::now_unix_millis() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
  // system_clock is never before the epoch on a correctly configured host.
  return millis < 0 ? 0 : static_cast<std::uint64_t>(millis);
}

std::uint64_t FixedClock::now_unix_millis() {
  return fixed_millis_;
}

}  // namespace puid::core
