#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace x402::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  NotAuthorized keeps its reason text as the status message prefix so clients can tell
  a bad signature from an expired timestamp or a consumed challenge.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace x402::grpc
