#pragma once

#include <stdexcept>
#include <string>

namespace cadence::util {

/*
  Central error types.

  ValidationError short-circuits a whole analysis call and is reported in the
  report's top-level error field. ComputationError and CollaboratorError are
  caught per stage. Transport adapters translate the rest to gRPC status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ComputationError : public std::runtime_error {
 public:
  explicit ComputationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CollaboratorError : public std::runtime_error {
 public:
  explicit CollaboratorError(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

} // namespace cadence::util
