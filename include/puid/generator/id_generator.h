#pragma once

#include "puid/generator/services.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace puid::generator {

// kDefaultRandomLength is the random suffix length used when the caller does not
// pick one.
constexpr std::size_t kDefaultRandomLength = 12;

// IdParts holds the encoded segments of one identifier before they are joined.
// Layout: <prefix>_<time><counter><pid><random>
struct IdParts {
  std::string prefix;   // NOLINT(readability-identifier-naming)
  std::string time;     // NOLINT(readability-identifier-naming)
  std::string counter;  // NOLINT(readability-identifier-naming)
  std::string pid;      // NOLINT(readability-identifier-naming)
  std::string random;   // NOLINT(readability-identifier-naming)

  // Everything after the separator except the random suffix.
  [[nodiscard]] std::string deterministic_body() const;

  [[nodiscard]] std::string str() const;

  bool operator==(const IdParts&) const = default;
};

// IdGenerator composes prefixed identifiers from the collaborators in
// GeneratorServices. Thread-safe as long as the collaborators are; the only
// shared mutable state is the SequenceCounter, advanced once per call.
class IdGenerator {
 public:
  explicit IdGenerator(GeneratorServices& services) : services_(services) {}

  // Throws std::invalid_argument if prefix violates is_valid_prefix.
  [[nodiscard]] IdParts compose(std::string_view prefix,
                                std::size_t random_length = kDefaultRandomLength);

  // compose(prefix, random_length).str()
  [[nodiscard]] std::string generate(std::string_view prefix,
                                     std::size_t random_length = kDefaultRandomLength);

 private:
  GeneratorServices& services_;
};

// process_id_generator returns the generator wired to the system clock, the
// process-wide SequenceCounter, the cached OS pid and per-thread randomness.
IdGenerator& process_id_generator();

// generate_id is the process-wide entry point.
// Throws std::invalid_argument if prefix is not 1-8 ASCII alphanumeric characters.
[[nodiscard]] std::string generate_id(std::string_view prefix,
                                      std::size_t random_length = kDefaultRandomLength);

}  // namespace puid::generator
