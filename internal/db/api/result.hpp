#pragma once

#include <string>

namespace orchestra::db {

// Backend-neutral failure classes. SnapshotStore maps them onto util errors.
enum class ErrorCode {
  OK = 0,

  ConstraintViolation,
  Conflict,
  Busy,
  IOError,
  Corruption,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace orchestra::db
