#include "internal/index/api/result.hpp"

#include "internal/util/errors.hpp"

namespace engram::index {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::DimensionMismatch:
      return "dimension_mismatch";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "internal_error";
}

void ThrowIfIndexError(const Result& result, const std::string& operation) {
  if (result) return;
  throw util::IndexError(operation + " failed (" + ToString(result.code) + "): " + result.message);
}

} // namespace engram::index
