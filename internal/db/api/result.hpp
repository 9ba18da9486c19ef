#pragma once

#include <string>

namespace meshgraph::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.

  Idempotent inserts report AlreadyExists when the natural key was present
  and nothing was written.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

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

// Busy and IOError may succeed on retry; everything else will not.
inline bool IsRetryable(const Result& r) {
  return r.code == ErrorCode::Busy || r.code == ErrorCode::IOError;
}

} // namespace meshgraph::db
