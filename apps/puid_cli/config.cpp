#include "config.h"

#include "puid/core/prefix.h"

#include <limits>

namespace puid::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_prefix(CliConfig& config, const std::string& value) {
  if (!core::is_valid_prefix(value)) {
    return false;
  }
  config.prefix = value;
  return true;
}

bool handle_length(CliConfig& config, const std::string& value) {
  const auto parsed = parse_size(value);
  if (!parsed.has_value() || parsed.value() > kMaxRandomLength) {
    return false;
  }
  config.random_length = parsed.value();
  return true;
}

bool handle_count(CliConfig& config, const std::string& value) {
  const auto parsed = parse_size(value);
  if (!parsed.has_value() || parsed.value() == 0 || parsed.value() > kMaxCount) {
    return false;
  }
  config.count = parsed.value();
  return true;
}

bool handle_json(CliConfig& config, const std::string& /*value*/) {
  config.json = true;
  return true;
}

bool handle_decode(CliConfig& config, const std::string& value) {
  config.decode = value;
  return true;
}

bool handle_help(CliConfig& config, const std::string& /*value*/) {
  config.help = true;
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<CliConfig>> build_option_registry() {
  return {
      {"--prefix", true, "ID prefix, 1-8 ASCII alphanumeric characters (default: id)",
       handle_prefix},
      {"--length", true, "Random suffix length, at most 1024 (default: 12)", handle_length},
      {"--count", true, "Number of IDs to generate, at most 100000 (default: 1)", handle_count},
      {"--json", false, "Print the generated IDs as a JSON document", handle_json},
      {"--decode", true, "Decode a base-36 string to decimal and exit", handle_decode},
      {"--help", false, "Show this message", handle_help},
  };
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

apps::ParseResult<CliConfig> parse_args(int argc, const char* const argv[]) {
  return apps::parse_options<CliConfig>(argc, argv, build_option_registry());
}

std::optional<std::size_t> parse_size(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }

  constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();

  std::size_t result = 0;
  for (const char c : value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    const auto digit = static_cast<std::size_t>(c - '0');
    if (result > (kMax - digit) / 10) {
      return std::nullopt;
    }
    result = result * 10 + digit;
  }
  return result;
}

}  // namespace puid::cli
