#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace krazedb::core {

// StorageError classifies failures raised by a set-storage backend.
// kUnavailable: the service cannot be reached (connect, I/O, timeout, closed connection).
// kBackend: the service answered with an error (wrong key type, auth, protocol).
enum class StorageError {
  kUnavailable,
  kBackend,
};

// Result<T, E> encodes success (T) or failure (E) explicitly, so that callers must check
// has_value() before touching the payload.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace krazedb::core
