#pragma once

#include <string>

namespace engram::index {

/*
  Portable index result codes.

  Backends translate their native errors into these; upper layers never
  see sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  ConstraintViolation,
  DimensionMismatch,

  IOError,
  Corruption,

  Unsupported,
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

const char* ToString(ErrorCode code);

// Converts a failed write into util::IndexError.
void ThrowIfIndexError(const Result& result, const std::string& operation);

} // namespace engram::index
