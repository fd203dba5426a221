#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace puid::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. The parser
// records the failure and keeps processing the remaining flags.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParseResult carries the populated config plus one message per rejected flag.
template <typename Config>
struct ParseResult {
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag
// to its handler. Unknown flags, missing values and handler failures are all
// reported through ParseResult::errors; the caller decides how to print them.
template <typename Config>
ParseResult<Config> parse_options(int argc, const char* const argv[],  // NOLINT(modernize-avoid-c-arrays)
                                  const std::vector<Option<Config>>& options, int start = 1,
                                  Config default_config = {}) {
  ParseResult<Config> result{std::move(default_config), {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      result.errors.push_back("Unknown option: " + arg);
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        result.errors.push_back("Option " + arg + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    if (!opt->handler(result.config, value)) {
      result.errors.push_back("Invalid value for " + arg + ": '" + value + "'");
    }
  }

  return result;
}

// format_usage renders one line per option, in registry order.
template <typename Config>
std::string format_usage(const std::string& program, const std::vector<Option<Config>>& options) {
  std::string out = "Usage: " + program + " [options]\n\nOptions:\n";
  for (const auto& opt : options) {
    std::string flag = opt.name + (opt.requires_value ? " <value>" : "");
    if (flag.size() < 22) {
      flag.append(22 - flag.size(), ' ');
    }
    out += "  " + flag + " " + opt.description + "\n";
  }
  return out;
}

}  // namespace puid::apps
