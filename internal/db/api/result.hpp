#pragma once

#include <string>
#include <string_view>

namespace roster::db {

/*
  Outcome of a repository write.

  Backends map their own failures onto these codes; nothing above
  internal/db ever sees a sqlite3 or pqxx error type.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,            // update of a missing row
  AlreadyExists,       // explicit id already taken
  ConstraintViolation, // foreign key or other constraint

  Busy,                 // sqlite lock contention
  SerializationFailure, // postgres serialization conflict
  IOError,
  Corruption,

  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      break;
  }
  return "internal error";
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

} // namespace roster::db
