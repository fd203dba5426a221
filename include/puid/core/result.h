#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>

namespace puid::core {

// PuidError enumerates caller contract violations detected before an ID is composed.
// Purpose-designed error type (E.14) instead of a bare bool or error string.
enum class PuidError {
  kInvalidPrefix,
};

// error_message returns the stable, human-readable description of an error.
[[nodiscard]] std::string_view error_message(PuidError error);

// Result<T, E> encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace puid::core
