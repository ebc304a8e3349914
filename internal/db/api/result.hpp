#pragma once

#include <string>

namespace trailwatch::db {

/*
  Outcome of a repository write.

  sqlite return codes are folded into these by the repository; nothing
  above internal/db/sqlite sees an SQLITE_* value. EventStore turns a
  failed Result into a logged, dropped event.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,
  ReadOnly,

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

const char* ToString(ErrorCode code);

} // namespace trailwatch::db
