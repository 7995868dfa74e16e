#pragma once

#include <stdexcept>
#include <string>

namespace omni::util {

/*
  Central error types.

  Core components throw these; the service layer turns ingest rejections
  into outcomes and the gRPC layer maps the rest to status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed market observation (non-positive or non-finite price, missing timestamp).
class InvalidObservation : public InvalidArgument {
 public:
  explicit InvalidObservation(const std::string& msg) : InvalidArgument(msg) {
  }
};

// Embedding provider failed or timed out; retried by embed workers.
class EmbeddingUnavailable : public std::runtime_error {
 public:
  explicit EmbeddingUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Per-asset window changed underneath a writer and retries were exhausted.
class StaleWindowConflict : public std::runtime_error {
 public:
  explicit StaleWindowConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Asset has an unfinished recompute-forward; its signals cannot be served.
class InconsistentBackfill : public std::runtime_error {
 public:
  explicit InconsistentBackfill(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace omni::util
