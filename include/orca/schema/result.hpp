#pragma once

#include <orca/schema/error_code.hpp>

#include <optional>
#include <string>
#include <utility>

namespace orca::schema {

/// Outcome of a fallible operation: a typed value or a coded failure.
///
/// `log` is the human-readable reason, `info` carries machine-oriented
/// context such as the missing amount or conflicting output references.
template <typename T>
struct result final {
  error_code code{error_code::ok};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == error_code::ok; }
  explicit operator bool() const { return ok(); }

  const T& operator*() const& { return *value; }
  T& operator*() & { return *value; }
  const T* operator->() const { return &*value; }
  T* operator->() { return &*value; }
};

/// Placeholder payload for operations that only report success.
struct unit final {
  bool operator==(const unit&) const = default;
};

template <typename T>
result<T> make_result(T value) {
  auto out = result<T>{};
  out.value = std::move(value);
  return out;
}

template <typename T>
result<T> make_error(const error_code code,
                     std::string log,
                     std::string info = {}) {
  auto out = result<T>{};
  out.code = code;
  out.log = std::move(log);
  out.info = std::move(info);
  out.codespace = std::string{orca::schema::codespace(code)};
  return out;
}

/// Re-type a failure so it can propagate through a caller's return type.
template <typename T, typename U>
result<T> forward_error(const result<U>& failed) {
  auto out = result<T>{};
  out.code = failed.code;
  out.log = failed.log;
  out.info = failed.info;
  out.codespace = failed.codespace;
  return out;
}

}  // namespace orca::schema
