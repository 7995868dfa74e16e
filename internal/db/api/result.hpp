#pragma once

#include <string>
#include <utility>

namespace omni::db {

/*
  Outcome of a single repository write.

  Backends translate sqlite / pqxx failures into these codes so the stores
  never see driver types. ThrowIfDbError turns a failed Result into the
  matching omni::util exception.
*/

enum class ErrorCode {
  OK = 0,

  // row addressed by id, symbol, url or (asset, timestamp) does not exist
  NotFound,
  // symbol, slug, url or (asset, timestamp) uniqueness
  AlreadyExists,
  // foreign key or check constraint, e.g. a signal for an unknown asset
  ConstraintViolation,

  // a concurrent writer won; the caller retries with a fresh transaction
  Busy,                 // SQLITE_BUSY / SQLITE_LOCKED
  Conflict,             // postgres deadlock
  SerializationFailure, // postgres SERIALIZABLE abort

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

  // True for the codes a fresh transaction may clear.
  bool Retryable() const {
    return code == ErrorCode::Busy || code == ErrorCode::Conflict || code == ErrorCode::SerializationFailure;
  }
};

} // namespace omni::db
