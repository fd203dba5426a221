#include "puid/core/random_source.h"

namespace puid::core {

std::string draw_alphanumeric(std::mt19937_64& engine, const std::size_t count) {
  // uniform_int_distribution rejects out-of-range samples, so there is no modulo bias.
  std::uniform_int_distribution<std::size_t> index(0, kAlphanumeric.size() - 1);

  std::string result;
  result.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    result.push_back(kAlphanumeric[index(engine)]);
  }
  return result;
}

std::string ThreadLocalRandomSource::draw(const std::size_t count) {
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  return draw_alphanumeric(engine, count);
}

std::string SeededRandomSource::draw(const std::size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  return draw_alphanumeric(engine_, count);
}

}  // namespace puid::core
