#pragma once

#include <string>
#include <utility>

namespace sealer::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.

  ConstraintViolation on a ledger insert means another bundle already
  claimed the tenant's chain slot or predecessor; callers retry with a
  freshly read predecessor.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
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

// Errors that mean "someone else won the race"; the write may be retried.
inline bool IsRetryable(ErrorCode code) {
  return code == ErrorCode::ConstraintViolation || code == ErrorCode::AlreadyExists || code == ErrorCode::Conflict ||
         code == ErrorCode::SerializationFailure;
}

} // namespace sealer::db
