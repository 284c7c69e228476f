#pragma once

#include <stdexcept>
#include <string>

namespace mediacache::util {

/*
  Central error types.

  These get translated later to HTTP and gRPC status codes.
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

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient transport failure or 5xx from the origin. Retried with backoff.
class NetworkError : public std::runtime_error {
 public:
  explicit NetworkError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Non-retryable HTTP status from the origin (4xx).
class OriginError : public std::runtime_error {
 public:
  OriginError(const std::string& msg, long status) : std::runtime_error(msg), status_(status) {
  }

  long Status() const {
    return status_;
  }

 private:
  long status_;
};

// Origin answered a ranged request with the whole body.
class RangeUnsupported : public std::runtime_error {
 public:
  explicit RangeUnsupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TimeoutError : public std::runtime_error {
 public:
  explicit TimeoutError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace mediacache::util
