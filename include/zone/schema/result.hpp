#pragma once

#include <zone/schema/error_code.hpp>
#include <optional>
#include <string>
#include <utility>

namespace zone::schema {

/// Envelope returned by fallible operations: a code, a human-readable log and
/// the value when the code is `ok`.
template <typename T>
struct result final {
  error_code code{error_code::ok};
  std::string log;
  std::optional<T> value;

  bool ok() const { return code == error_code::ok && value.has_value(); }
};

template <typename T>
result<T> make_result(T value) {
  return result<T>{
      .code = error_code::ok, .log = {}, .value = std::move(value)};
}

template <typename T>
result<T> make_error(const error_code code, std::string log) {
  return result<T>{.code = code, .log = std::move(log), .value = std::nullopt};
}

}  // namespace zone::schema
