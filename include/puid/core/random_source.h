#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace puid::core {

// kAlphanumeric is the fixed alphabet of the random suffix: digits, then upper
// case, then lower case ASCII letters. 62 symbols, none excluded, so every
// character carries log2(62) ~= 5.95 bits.
constexpr std::string_view kAlphanumeric =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

// Abstract source of random suffix characters.
// Contract: draw(n) returns exactly n characters, each drawn independently and
// uniformly from kAlphanumeric. draw(0) returns an empty string.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  virtual std::string draw(std::size_t count) = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Production source: one std::mt19937_64 per thread, seeded from std::random_device.
// Lock-free; no entropy pool is shared between threads.
class ThreadLocalRandomSource final : public IRandomSource {
 public:
  ThreadLocalRandomSource() = default;
  ~ThreadLocalRandomSource() override = default;

  ThreadLocalRandomSource(const ThreadLocalRandomSource&) = default;
  ThreadLocalRandomSource& operator=(const ThreadLocalRandomSource&) = default;
  ThreadLocalRandomSource(ThreadLocalRandomSource&&) = default;
  ThreadLocalRandomSource& operator=(ThreadLocalRandomSource&&) = default;

  std::string draw(std::size_t count) override;
};

// Seeded source: reproducible sequence for tests and demos.
// Thread-safe. The engine is shared, so draws are serialized by a mutex.
class SeededRandomSource final : public IRandomSource {
 public:
  explicit SeededRandomSource(std::uint64_t seed) : engine_(seed) {}
  ~SeededRandomSource() override = default;

  // Not copyable or movable (contains mutex)
  SeededRandomSource(const SeededRandomSource&) = delete;
  SeededRandomSource& operator=(const SeededRandomSource&) = delete;
  SeededRandomSource(SeededRandomSource&&) = delete;
  SeededRandomSource& operator=(SeededRandomSource&&) = delete;

  std::string draw(std::size_t count) override;

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

// draw_alphanumeric fills count characters from engine. Shared by both sources.
std::string draw_alphanumeric(std::mt19937_64& engine, std::size_t count);

}  // namespace puid::core
