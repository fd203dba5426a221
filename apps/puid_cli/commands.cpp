#include "commands.h"

#include "puid/core/base36.h"
#include "puid/generator/id_generator.h"

#include <nlohmann/json.hpp>

#include <ostream>
#include <stdexcept>
#include <vector>

namespace puid::cli {

int run_demo(std::ostream& out) {
  out << generator::generate_id("foo") << "\n";
  out << generator::generate_id("bar", 24) << "\n";
  return 0;
}

int run_decode(const std::string& text, std::ostream& out, std::ostream& err) {
  const auto value = core::from_base36(text);
  if (!value.has_value()) {
    err << "Invalid base-36 value: '" << text << "' (expected 0-9a-z, at most 64 bits)\n";
    return 1;
  }
  out << value.value() << "\n";
  return 0;
}

int run_generate(const CliConfig& config, std::ostream& out, std::ostream& err) {
  const std::string prefix = config.prefix.value_or(kDefaultPrefix);

  std::vector<std::string> ids;
  ids.reserve(config.count);
  try {
    for (std::size_t i = 0; i < config.count; ++i) {
      ids.push_back(generator::generate_id(prefix, config.random_length));
    }
  } catch (const std::invalid_argument& e) {
    err << "Error: " << e.what() << "\n";
    return 1;
  }

  if (config.json) {
    nlohmann::json doc;
    doc["prefix"] = prefix;
    doc["random_length"] = config.random_length;
    doc["ids"] = ids;
    out << doc.dump(2) << "\n";
  } else {
    for (const auto& id : ids) {
      out << id << "\n";
    }
  }
  return 0;
}

}  // namespace puid::cli
