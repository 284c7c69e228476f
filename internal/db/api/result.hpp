#pragma once

#include <string>

namespace mediacache::db {

/*
  Outcome of a repository write.

  Backends map sqlite3 / pqxx failures onto these codes so that CacheIndex
  can turn them into util errors without knowing which engine is behind it.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,      // entry id or key has no row
  AlreadyExists, // (source_id, media_id, quality) taken
  Busy,          // sqlite lock contention outlived busy_timeout

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::SerializationFailure: return "serialization failure";
    case ErrorCode::IOError: return "io error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() { return {}; }

  static Result Err(ErrorCode c, std::string msg = {}) { return {c, std::move(msg)}; }

  explicit operator bool() const { return code == ErrorCode::OK; }
};

} // namespace mediacache::db
