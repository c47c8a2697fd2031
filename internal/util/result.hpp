#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace cadence::util {

/*
  Outcome of one analysis stage: either a value or an error stub.

  Stages never let exceptions cross their boundary; the orchestration
  layers fold these into reports and error lists.
*/
template <typename T>
struct Result {
  std::optional<T> value;
  std::string      error;

  static Result Ok(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result Err(std::string msg) {
    Result r;
    r.error = msg.empty() ? "unknown error" : std::move(msg);
    return r;
  }

  explicit operator bool() const {
    return value.has_value();
  }

  const T& operator*() const {
    return *value;
  }

  const T* operator->() const {
    return &*value;
  }

  const T& Value() const {
    if (!value) {
      throw std::logic_error("Result has no value: " + error);
    }
    return *value;
  }
};

} // namespace cadence::util
