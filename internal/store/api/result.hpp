#pragma once

#include <stdexcept>
#include <string>

namespace backupmeta::store {

/*
  Portable store result codes.

  Engines translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  InvalidArgument,
  ConstraintViolation,

  IOError,
  Corruption,
  Closed,

  Unsupported,
  InternalError
};

const char* ToString(ErrorCode code);

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

/*
  Raised for store failures on read paths (Get / Scan / table lookup), and by
  ThrowIfError for failed write results. Propagated to callers unchanged.
*/
class StoreError : public std::runtime_error {
 public:
  StoreError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

void ThrowIfError(const Result& result, const std::string& prefix);

} // namespace backupmeta::store
