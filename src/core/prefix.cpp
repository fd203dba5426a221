#include "puid/core/prefix.h"

#include <algorithm>

namespace puid::core {

namespace {

bool is_ascii_alphanumeric(const char ch) {
  return (ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
}

}  // namespace

bool is_valid_prefix(const std::string_view prefix) {
  if (prefix.size() < kPrefixMinLength || prefix.size() > kPrefixMaxLength) {
    return false;
  }
  return std::all_of(prefix.begin(), prefix.end(), is_ascii_alphanumeric);
}

}  // namespace puid::core
