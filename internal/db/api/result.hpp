#pragma once

#include <string>
#include <utility>

namespace edgesync::db {

/*
  Outcome of a single repository write.

  Both backends map their native failures onto ErrorCode so the record
  store can decide between NotFound, InvalidState and StorageFull without
  knowing which backend produced the error.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,      // no row for the record id
  AlreadyExists, // record id inserted twice
  Conflict,      // link of a missing or already chained record
  Busy,

  ConstraintViolation, // sequence reused
  Full,                // disk or page quota exhausted

  IOError,
  Corruption,

  InternalError
};

constexpr const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Full:
      return "storage full";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
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

  std::string Describe() const {
    return message.empty() ? std::string(ToString(code)) : std::string(ToString(code)) + " (" + message + ")";
  }
};

} // namespace edgesync::db
