#pragma once

#include <stdexcept>
#include <string>

namespace buildq::util {

/*
  Central error types.

  Handlers throw these; the queue records what() verbatim on the failed job.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IoError : public std::runtime_error {
 public:
  explicit IoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Failure reported by a container engine, git, or the store.
class ExternalError : public std::runtime_error {
 public:
  explicit ExternalError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace buildq::util
