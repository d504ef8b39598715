#pragma once

#include <string>

namespace retest::db {

/*
  Backend-neutral outcome of a repository call.

  sqlite result codes are folded into these by the backend; the
  engine only distinguishes Corruption from everything else.
*/
enum class ErrorCode {
  OK = 0,

  // lock held by another writer
  Busy,
  // empty key, duplicate row
  ConstraintViolation,
  IOError,
  // the file is not a database, or its contents are damaged
  Corruption,
  // write through a read transaction
  ReadOnly,
  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::ReadOnly:
      return "read-only transaction";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

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

} // namespace retest::db
