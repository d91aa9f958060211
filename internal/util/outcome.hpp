#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/api/result.hpp"

namespace gigbook::util {

/*
  Value or typed failure.

  Used for the recoverable failure classes (NotFound, AlreadyExists,
  ValidationFailure) that callers are expected to branch on.
*/
template <typename T>
class Outcome {
 public:
  static Outcome Ok(T value) {
    Outcome out;
    out.value_ = std::move(value);
    return out;
  }

  static Outcome Err(db::ErrorCode code, std::string message) {
    Outcome out;
    out.code_    = code;
    out.message_ = std::move(message);
    return out;
  }

  static Outcome From(const db::Result& result) {
    return Err(result.code, result.message);
  }

  explicit operator bool() const {
    return value_.has_value();
  }

  bool ok() const {
    return value_.has_value();
  }

  db::ErrorCode code() const {
    return code_;
  }

  const std::string& message() const {
    return message_;
  }

  const T& value() const& {
    if (!value_) throw std::logic_error("Outcome has no value: " + message_);
    return *value_;
  }

  T& value() & {
    if (!value_) throw std::logic_error("Outcome has no value: " + message_);
    return *value_;
  }

  T&& value() && {
    if (!value_) throw std::logic_error("Outcome has no value: " + message_);
    return std::move(*value_);
  }

  const T* operator->() const {
    return &value();
  }

  const T& operator*() const {
    return value();
  }

 private:
  std::optional<T> value_;
  db::ErrorCode    code_ = db::ErrorCode::OK;
  std::string      message_;
};

} // namespace gigbook::util
