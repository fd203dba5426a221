#pragma once

#include "shared/arg_parser.h"

#include "puid/generator/id_generator.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace puid::cli {

// CliConfig holds all parsed flags for puid_cli.
// Every field has an explicit default; optional fields mean "not requested".
struct CliConfig {
  std::optional<std::string> prefix;                                  // NOLINT(readability-identifier-naming)
  std::size_t random_length{generator::kDefaultRandomLength};         // NOLINT(readability-identifier-naming)
  std::size_t count{1};                                               // NOLINT(readability-identifier-naming)
  bool json{false};                                                   // NOLINT(readability-identifier-naming)
  bool help{false};                                                   // NOLINT(readability-identifier-naming)
  std::optional<std::string> decode;                                  // NOLINT(readability-identifier-naming)
};

// kDefaultPrefix applies when --prefix is absent but other generation flags are given.
constexpr const char* kDefaultPrefix = "id";

// Upper bounds for --length and --count. Larger values are rejected as invalid
// option values instead of reaching the allocator.
constexpr std::size_t kMaxRandomLength = 1024;
constexpr std::size_t kMaxCount = 100000;

// build_option_registry lists every flag puid_cli understands.
std::vector<apps::Option<CliConfig>> build_option_registry();

// parse_args parses argv[1..argc-1] against build_option_registry().
apps::ParseResult<CliConfig> parse_args(int argc, const char* const argv[]);  // NOLINT(modernize-avoid-c-arrays)

// parse_size accepts a plain non-negative decimal integer (no sign, no spaces).
std::optional<std::size_t> parse_size(const std::string& value);

}  // namespace puid::cli
