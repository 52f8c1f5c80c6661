#pragma once

// This component provides a class template, `Expected<T>`, that holds either a
// value of type `T` or an `Error`. `Expected<void>` holds either nothing or an
// `Error`.
//
// Operations that can fail for reasons the caller should handle return
// `Expected`. Check the result with `operator bool` or `if_error()` before
// reading the value:
//
//     auto config = finalize_config(BaggageConfig{});
//     if (auto* error = config.if_error()) {
//       logger.log_error(*error);
//       return;
//     }
//     BaggageFieldsFactory factory{*config};

#include <optional>
#include <utility>
#include <variant>

#include "error.h"

namespace tracebag {
namespace tracing {

template <typename Value>
class Expected {
  std::variant<Value, Error> data_;

 public:
  Expected() = default;
  Expected(const Expected&) = default;
  // Without this overload, copying a non-const `Expected` would select the
  // forwarding constructor below.
  Expected(Expected&) = default;
  Expected(Expected&&) = default;
  Expected& operator=(const Expected&) = default;
  Expected& operator=(Expected&&) = default;

  template <typename Other>
  Expected(Other&& other) : data_(std::forward<Other>(other)) {}
  template <typename Other>
  Expected& operator=(Other&& other) {
    data_ = std::forward<Other>(other);
    return *this;
  }

  bool has_value() const noexcept {
    return std::holds_alternative<Value>(data_);
  }
  explicit operator bool() const noexcept { return has_value(); }

  Value& value() & { return std::get<0>(data_); }
  const Value& value() const& { return std::get<0>(data_); }
  Value&& value() && { return std::move(std::get<0>(data_)); }

  Value& operator*() & { return value(); }
  const Value& operator*() const& { return value(); }
  Value&& operator*() && { return std::move(value()); }

  Value* operator->() { return &value(); }
  const Value* operator->() const { return &value(); }

  Error& error() & { return std::get<1>(data_); }
  const Error& error() const& { return std::get<1>(data_); }
  Error&& error() && { return std::move(std::get<1>(data_)); }

  Error* if_error() & { return std::get_if<1>(&data_); }
  const Error* if_error() const& { return std::get_if<1>(&data_); }
  // Don't use `if_error` on an rvalue (temporary).
  Error* if_error() && = delete;
  const Error* if_error() const&& = delete;
};

template <>
class Expected<void> {
  std::optional<Error> data_;

 public:
  Expected() = default;
  Expected(const Expected&) = default;
  Expected(Expected&) = default;
  Expected(Expected&&) = default;
  Expected& operator=(const Expected&) = default;
  Expected& operator=(Expected&&) = default;

  template <typename Other>
  Expected(Other&& other) : data_(std::forward<Other>(other)) {}
  template <typename Other>
  Expected& operator=(Other&& other) {
    data_ = std::forward<Other>(other);
    return *this;
  }

  bool has_value() const noexcept { return !data_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  Error& error() & { return *data_; }
  const Error& error() const& { return *data_; }
  Error&& error() && { return std::move(*data_); }

  Error* if_error() & { return data_ ? &*data_ : nullptr; }
  const Error* if_error() const& { return data_ ? &*data_ : nullptr; }
  Error* if_error() && = delete;
  const Error* if_error() const&& = delete;
};

}  // namespace tracing
}  // namespace tracebag
