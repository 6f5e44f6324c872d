#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace x402::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace x402::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const EntryNotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (const auto* existing = dynamic_cast<const AlreadyRegistered*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what(), existing->existing_id()};
  }
  if (dynamic_cast<const NotAuthorized*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const StorageConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const ProbeFailed*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace x402::grpc
