#pragma once

#include <stdexcept>
#include <string>

namespace backupmeta::util {

/*
  Central error types.

  Absent records are never errors: readers return std::nullopt or an
  empty container. Store I/O failures are store::StoreError and pass
  through unchanged.
*/

// A row exists but its payload cannot be decoded (e.g. left behind by a partial write).
class MalformedData : public std::runtime_error {
 public:
  explicit MalformedData(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unsupported : public std::runtime_error {
 public:
  explicit Unsupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The system table did not become available within the configured budget.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace backupmeta::util
