#pragma once

#include <cstddef>
#include <string_view>

namespace puid::core {

// kSeparator joins the prefix to the generated body. No generated part emits it.
constexpr char kSeparator = '_';

constexpr std::size_t kPrefixMinLength = 1;
constexpr std::size_t kPrefixMaxLength = 8;

// is_valid_prefix applies the prefix policy:
// - Length between kPrefixMinLength and kPrefixMaxLength bytes
// - ASCII alphanumeric only ([0-9A-Za-z]); this also excludes kSeparator
// Locale-independent.
[[nodiscard]] bool is_valid_prefix(std::string_view prefix);

}  // namespace puid::core
