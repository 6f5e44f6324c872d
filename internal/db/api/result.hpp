#pragma once

#include <string>
#include <utility>

namespace x402::db {

// Outcome codes shared by every KeyValueStore backend. Conditional writes report
// the precondition they failed; engine failures are folded into the last three.
enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  VersionMismatch,
  Busy,           // lock contention; the same write may succeed if repeated
  StorageFailure, // I/O, full disk, corrupt or unopenable file
  InternalError,
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

  // A conditional write lost to a concurrent one.
  bool Conflict() const {
    return code == ErrorCode::NotFound || code == ErrorCode::AlreadyExists || code == ErrorCode::VersionMismatch;
  }

  bool Retryable() const {
    return Conflict() || code == ErrorCode::Busy;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ErrorCodeName(ErrorCode code);

} // namespace x402::db
