#pragma once

#include <string>

namespace ledgersync::db {

/*
  Portable repository result codes.

  Backends translate their own errors into these; EntityStore maps them
  onto util:: exceptions. Nothing above the repository sees sqlite codes.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,      // (kind, id) absent
  AlreadyExists, // (kind, id) taken
  Conflict,
  Busy,          // lock wait timed out

  ConstraintViolation,

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

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace ledgersync::db
