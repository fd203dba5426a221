#include "puid/core/process_id.h"

#if defined(_WIN32)
#include <process.h>
#else
#include <unistd.h>
#endif

namespace puid::core {

std::uint64_t current_process_id() {
#if defined(_WIN32)
  return static_cast<std::uint64_t>(_getpid());
#else
  return static_cast<std::uint64_t>(getpid());
#endif
}

SystemProcessIdSource::SystemProcessIdSource() : pid_(current_process_id()) {}

std::uint64_t SystemProcessIdSource::process_id() {
  return pid_;
}

std::uint64_t FixedProcessIdSource::process_id() {
  return pid_;
}

}  // namespace puid::core
