#include "internal/db/api/result.hpp"

namespace buildq::db {

namespace {

const char* CodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

} // namespace

std::string Describe(const Result& result) {
  std::string out = CodeName(result.code);
  if (!result.message.empty()) {
    out += ": " + result.message;
  }
  return out;
}

} // namespace buildq::db
