#pragma once

#include <stdexcept>
#include <string>

namespace engram::util {

/*
  Central error types.

  Validation errors derive from InvalidArgument so callers can catch the
  whole family at once.
*/

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class InvalidRelationshipType : public InvalidArgument {
 public:
  explicit InvalidRelationshipType(const std::string& msg) : InvalidArgument(msg) {
  }
};

class SelfLoop : public InvalidArgument {
 public:
  explicit SelfLoop(const std::string& msg) : InvalidArgument(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedBackend : public std::runtime_error {
 public:
  explicit UnsupportedBackend(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by vector index backends; read paths in the core catch and degrade.
class IndexError : public std::runtime_error {
 public:
  explicit IndexError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace engram::util
