#include "puid/generator/puid_builder.h"

#include "puid/core/prefix.h"

#include <utility>

namespace puid::generator {

PuidBuilder PuidBuilder::create() {
  return PuidBuilder(process_id_generator());
}

PuidBuilder PuidBuilder::create(IdGenerator& generator) {
  return PuidBuilder(generator);
}

PuidBuilder::BuilderResult PuidBuilder::prefix(const std::string_view prefix) const {
  if (!core::is_valid_prefix(prefix)) {
    return BuilderResult::err(core::PuidError::kInvalidPrefix);
  }
  PuidBuilder next = *this;
  next.prefix_ = std::string(prefix);
  return BuilderResult::ok(std::move(next));
}

PuidBuilder& PuidBuilder::entropy(const std::size_t random_length) {
  random_length_ = random_length;
  return *this;
}

PuidBuilder::IdResult PuidBuilder::build() const {
  // prefix_ is either empty or already validated by prefix().
  if (prefix_.empty()) {
    return IdResult::err(core::PuidError::kInvalidPrefix);
  }
  return IdResult::ok(generator_->generate(prefix_, random_length_));
}

}  // namespace puid::generator
