#include "puid/generator/id_generator.h"

#include "puid/core/base36.h"
#include "puid/core/prefix.h"
#include "puid/core/result.h"

#include <stdexcept>

namespace puid::generator {

std::string IdParts::deterministic_body() const {
  return time + counter + pid;
}

std::string IdParts::str() const {
  std::string result;
  result.reserve(prefix.size() + 1 + time.size() + counter.size() + pid.size() + random.size());
  result.append(prefix);
  result.push_back(core::kSeparator);
  result.append(time);
  result.append(counter);
  result.append(pid);
  result.append(random);
  return result;
}

IdParts IdGenerator::compose(const std::string_view prefix, const std::size_t random_length) {
  if (!core::is_valid_prefix(prefix)) {
    throw std::invalid_argument(std::string(core::error_message(core::PuidError::kInvalidPrefix)) +
                                " Got: \"" + std::string(prefix) + "\"");
  }

  IdParts parts;
  parts.prefix = std::string(prefix);
  parts.time = core::to_base36(services_.clock.now_unix_millis());
  parts.counter = core::to_base36(services_.counter.next());
  parts.pid = core::to_base36(services_.process_ids.process_id());
  parts.random = services_.random.draw(random_length);
  return parts;
}

std::string IdGenerator::generate(const std::string_view prefix, const std::size_t random_length) {
  return compose(prefix, random_length).str();
}

IdGenerator& process_id_generator() {
  static core::SystemClock clock;
  static core::SystemProcessIdSource process_ids;
  static core::ThreadLocalRandomSource random;
  static GeneratorServices services{clock, core::process_sequence_counter(), process_ids, random};
  static IdGenerator generator{services};
  return generator;
}

std::string generate_id(const std::string_view prefix, const std::size_t random_length) {
  return process_id_generator().generate(prefix, random_length);
}

}  // namespace puid::generator
