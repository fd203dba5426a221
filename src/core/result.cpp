#include "puid/core/result.h"

namespace puid::core {

std::string_view error_message(const PuidError error) {
  switch (error) {
    case PuidError::kInvalidPrefix:
      return "Prefix must be 1 to 8 ASCII alphanumeric characters.";
  }
  return "Unknown error.";
}

}  // namespace puid::core
