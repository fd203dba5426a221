#pragma once

#include "puid/core/result.h"
#include "puid/generator/id_generator.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace puid::generator {

// PuidBuilder is the non-throwing front end to IdGenerator.
//
// Usage:
//   auto builder = PuidBuilder::create().prefix("foo");
//   if (!builder.has_value()) { ... }
//   auto id = builder.value().entropy(24).build();
//
// Prefix violations surface as PuidError::kInvalidPrefix instead of an exception.
class PuidBuilder {
 public:
  using BuilderResult = core::Result<PuidBuilder, core::PuidError>;
  using IdResult = core::Result<std::string, core::PuidError>;

  // Builder bound to process_id_generator().
  static PuidBuilder create();

  // Builder bound to an explicit generator, which must outlive the builder.
  static PuidBuilder create(IdGenerator& generator);

  // Returns a copy with the prefix set, or kInvalidPrefix.
  [[nodiscard]] BuilderResult prefix(std::string_view prefix) const;

  // Sets the random suffix length.
  PuidBuilder& entropy(std::size_t random_length);

  // Fails with kInvalidPrefix when no prefix was set.
  [[nodiscard]] IdResult build() const;

  [[nodiscard]] std::size_t random_length() const { return random_length_; }

 private:
  explicit PuidBuilder(IdGenerator& generator) : generator_(&generator) {}

  IdGenerator* generator_;
  std::string prefix_;
  std::size_t random_length_{kDefaultRandomLength};
};

}  // namespace puid::generator
