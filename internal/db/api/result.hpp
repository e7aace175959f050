#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace swarm::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
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

// Raises the domain exception matching a failed Result.
inline void ThrowIfError(const Result& r, const std::string& what) {
  if (r) return;

  const std::string msg = what + ": " + r.message;
  switch (r.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(msg);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(msg);
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw util::TransientError(msg);
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation:
      throw util::InvalidState(msg);
    default:
      throw std::runtime_error(msg);
  }
}

} // namespace swarm::db
