#pragma once

#include <cstdint>

namespace puid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests pin the timestamp so that
// only the counter distinguishes IDs.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return whole milliseconds elapsed since the Unix epoch.
  virtual std::uint64_t now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: reads std::chrono::system_clock.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_unix_millis() override;
};

// Fixed clock: returns a constant timestamp for deterministic tests/demos.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::uint64_t fixed_millis) : fixed_millis_(fixed_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::uint64_t now_unix_millis() override;

 private:
  std::uint64_t fixed_millis_;
};

}  // namespace puid::core
