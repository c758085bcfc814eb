#pragma once

#include <string>

namespace buildq::db {

/*
  Store write outcome.

  Backends translate their native errors into ErrorCode so the job
  handlers can log a failed status update without knowing about sqlite.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,      // update targeted a missing row
  AlreadyExists, // caller-chosen id already taken
  Busy,          // database locked past the busy timeout

  ConstraintViolation, // e.g. build for an unknown service

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
};

// "<code name>: <message>", used in log fields and error texts.
std::string Describe(const Result& result);

} // namespace buildq::db
