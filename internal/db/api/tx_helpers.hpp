#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace omni::db {

/*
  Shared glue between repository results and the exception-based core.
*/

// Busy and serialization failures surface as TransactionConflict so the
// caller's retry loop treats them like a failed commit.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (result.Retryable()) {
    throw TransactionConflict(message);
  }
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    default:
      throw std::runtime_error(message);
  }
}

// Runs fn until it completes without a TransactionConflict. fn must open
// its own transaction on every call. After `attempts` conflicts the last
// one is reported as StaleWindowConflict.
template <typename Fn>
auto RunWithConflictRetry(std::size_t attempts, std::string_view what, Fn&& fn) -> decltype(fn()) {
  if (attempts == 0) attempts = 1;
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const TransactionConflict& e) {
      if (attempt >= attempts) {
        OMNI_LOG_ERROR("Transaction retries exhausted",
                       {observability::StringField("op", what), observability::UintField("attempts", attempt),
                        observability::StringField("error", e.what())});
        throw util::StaleWindowConflict(std::string(what) + ": " + e.what());
      }
      OMNI_LOG_WARN("Transaction conflict, retrying",
                    {observability::StringField("op", what), observability::UintField("attempt", attempt)});
      std::this_thread::yield();
    }
  }
}

} // namespace omni::db
