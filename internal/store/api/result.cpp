#include "internal/store/api/result.hpp"

namespace backupmeta::store {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::InvalidArgument:
      return "invalid argument";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Closed:
      return "closed";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

void ThrowIfError(const Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  std::string msg = prefix + ": " + ToString(result.code);
  if (!result.message.empty()) {
    msg += ": " + result.message;
  }
  throw StoreError(result.code, msg);
}

} // namespace backupmeta::store
