#pragma once

#include <cstdint>

namespace puid::core {

// Abstract source of the OS-assigned process identifier.
// The value is constant for the lifetime of a process.
class IProcessIdSource {
 public:
  virtual ~IProcessIdSource() = default;

  virtual std::uint64_t process_id() = 0;

 protected:
  IProcessIdSource() = default;
  IProcessIdSource(const IProcessIdSource&) = default;
  IProcessIdSource& operator=(const IProcessIdSource&) = default;
  IProcessIdSource(IProcessIdSource&&) = default;
  IProcessIdSource& operator=(IProcessIdSource&&) = default;
};

// Production source: asks the OS once and caches the answer.
class SystemProcessIdSource final : public IProcessIdSource {
 public:
  SystemProcessIdSource();
  ~SystemProcessIdSource() override = default;

  SystemProcessIdSource(const SystemProcessIdSource&) = default;
  SystemProcessIdSource& operator=(const SystemProcessIdSource&) = default;
  SystemProcessIdSource(SystemProcessIdSource&&) = default;
  SystemProcessIdSource& operator=(SystemProcessIdSource&&) = default;

  std::uint64_t process_id() override;

 private:
  std::uint64_t pid_;
};

// Fixed source: returns a constant pid for deterministic tests.
class FixedProcessIdSource final : public IProcessIdSource {
 public:
  explicit FixedProcessIdSource(std::uint64_t pid) : pid_(pid) {}
  ~FixedProcessIdSource() override = default;

  FixedProcessIdSource(const FixedProcessIdSource&) = default;
  FixedProcessIdSource& operator=(const FixedProcessIdSource&) = default;
  FixedProcessIdSource(FixedProcessIdSource&&) = default;
  FixedProcessIdSource& operator=(FixedProcessIdSource&&) = default;

  std::uint64_t process_id() override;

 private:
  std::uint64_t pid_;
};

// current_process_id queries the OS directly, without caching.
[[nodiscard]] std::uint64_t current_process_id();

}  // namespace puid::core
