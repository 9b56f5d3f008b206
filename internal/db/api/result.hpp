#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace beacon::db {

/*
  Portable DB result codes.

  Backends translate native failures (sqlite return codes, pqxx exceptions)
  into these. Upper layers never see backend error types.

  Heartbeat inserts use two codes distinctly:
    AlreadyExists  same (server_id, heartbeat_id) pair, i.e. a replay
    Conflict       heartbeat_id owned by a different server

  MarkJobProcessed returns Conflict when the job was re-enqueued while claimed.
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

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
    default:
      return "internal_error";
  }
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
    if (message.empty()) return std::string(ToString(code));
    return std::string(ToString(code)) + ": " + message;
  }
};

} // namespace beacon::db
