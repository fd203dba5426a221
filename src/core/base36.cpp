#include "puid/core/base36.h"

#include <algorithm>
#include <limits>

namespace puid::core {

std::string to_base36(std::uint64_t value) {
  if (value == 0) {
    return std::string{"0"};
  }

  // 36^13 > 2^64, so 13 digits cover every uint64_t.
  std::string result;
  result.reserve(13);
  while (value > 0) {
    result.push_back(kBase36Digits[value % kBase36Radix]);
    value /= kBase36Radix;
  }
  std::reverse(result.begin(), result.end());
  return result;
}

std::optional<std::uint64_t> from_base36(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();

  std::uint64_t value = 0;
  for (const char ch : text) {
    std::uint64_t digit = 0;
    if (ch >= '0' && ch <= '9') {
      digit = static_cast<std::uint64_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'z') {
      digit = static_cast<std::uint64_t>(ch - 'a') + 10;
    } else {
      return std::nullopt;
    }

    // Overflow check before value * 36 + digit.
    if (value > (kMax - digit) / kBase36Radix) {
      return std::nullopt;
    }
    value = value * kBase36Radix + digit;
  }
  return value;
}

}  // namespace puid::core
