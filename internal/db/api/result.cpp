#include "result.hpp"

namespace x402::db {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::VersionMismatch: return "version_mismatch";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::StorageFailure: return "storage_failure";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
}

} // namespace x402::db
