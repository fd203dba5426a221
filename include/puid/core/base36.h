#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace puid::core {

// Base-36 encoding of non-negative integers with digits 0-9 and lowercase a-z.
//
// Rules:
// - Most significant digit first, no leading zeros, no sign
// - Zero encodes as the single character "0"
// - Output is at most 13 characters for a 64-bit value
constexpr std::uint64_t kBase36Radix = 36;
constexpr std::string_view kBase36Digits = "0123456789abcdefghijklmnopqrstuvwxyz";

// to_base36 encodes value. Pure and deterministic.
[[nodiscard]] std::string to_base36(std::uint64_t value);

// from_base36 decodes a lowercase base-36 string.
// Returns nullopt for an empty string, a character outside 0-9a-z, or a value
// that does not fit in 64 bits.
[[nodiscard]] std::optional<std::uint64_t> from_base36(std::string_view text);

}  // namespace puid::core
