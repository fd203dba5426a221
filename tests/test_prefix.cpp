#include "puid/core/prefix.h"
#include "puid/core/result.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace puid::core;

TEST_CASE("is_valid_prefix: accepted prefixes", "[prefix]") {
  const std::vector<std::string> valid = {"f", "fo", "foo", "quux", "b4r", "ABC", "abcdefgh"};
  for (const auto& p : valid) {
    INFO("prefix: " << p);
    CHECK(is_valid_prefix(p));
  }
}

TEST_CASE("is_valid_prefix: rejected prefixes", "[prefix]") {
  const std::vector<std::pair<std::string, std::string>> invalid = {
      {"", "empty"},
      {"b??z", "non-alphanumeric"},
      {"a_b", "contains the separator"},
      {"_", "separator only"},
      {"abcdefghi", "longer than 8 characters"},
      {"b\xC3\xA4z", "non-ASCII"},
      {"fo o", "contains a space"},
  };
  for (const auto& [prefix, why] : invalid) {
    INFO(why);
    CHECK_FALSE(is_valid_prefix(prefix));
  }
}

TEST_CASE("error_message: invalid prefix text is stable", "[prefix][error]") {
  CHECK(error_message(PuidError::kInvalidPrefix) ==
        "Prefix must be 1 to 8 ASCII alphanumeric characters.");
}
