#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <grpcpp/grpcpp.h>

#include "x402/registry/v1/registry_service.grpc.pb.h"
#include "internal/service/registry_service.hpp"
#include "x402/registry/v1.hpp"

namespace x402::grpc {

// Metadata the x402 gateway attaches to every call it forwards.
inline constexpr const char* kGatewayTokenHeader = "x-x402-gateway-token";

/*
  gRPC transport for RegistryService.

  PaymentContext describes a settlement made at the x402 gateway, so it is taken
  only from callers presenting gateway_token in kGatewayTokenHeader. Any other
  caller sending one gets PERMISSION_DENIED. An empty token trusts no caller.
*/
class RegistryServer final : public x402::registry::v1::RegistryService::Service {
public:
  explicit RegistryServer(std::shared_ptr<x402::service::RegistryService> svc, std::string gateway_token = {});

  ::grpc::Status Register(::grpc::ServerContext*,
                          const x402::registry::v1::RegisterRequest*,
                          x402::registry::v1::RegisterResponse*) override;

  ::grpc::Status Update(::grpc::ServerContext*,
                        const x402::registry::v1::UpdateRequest*,
                        x402::registry::v1::UpdateResponse*) override;

  ::grpc::Status Delete(::grpc::ServerContext*,
                        const x402::registry::v1::DeleteRequest*,
                        x402::registry::v1::DeleteResponse*) override;

  ::grpc::Status Transfer(::grpc::ServerContext*,
                          const x402::registry::v1::TransferRequest*,
                          x402::registry::v1::TransferResponse*) override;

  ::grpc::Status RequestChallenge(::grpc::ServerContext*,
                                  const x402::registry::v1::RequestChallengeRequest*,
                                  x402::registry::v1::RequestChallengeResponse*) override;

  ::grpc::Status MyEndpoints(::grpc::ServerContext*,
                             const x402::registry::v1::MyEndpointsRequest*,
                             x402::registry::v1::MyEndpointsResponse*) override;

  ::grpc::Status Details(::grpc::ServerContext*,
                         const x402::registry::v1::DetailsRequest*,
                         x402::registry::v1::DetailsResponse*) override;

  ::grpc::Status List(::grpc::ServerContext*,
                      const x402::registry::v1::ListRequest*,
                      x402::registry::v1::ListResponse*) override;

  ::grpc::Status AdminPending(::grpc::ServerContext*,
                              const x402::registry::v1::AdminPendingRequest*,
                              x402::registry::v1::AdminPendingResponse*) override;

  ::grpc::Status AdminVerify(::grpc::ServerContext*,
                             const x402::registry::v1::AdminVerifyRequest*,
                             x402::registry::v1::AdminVerifyResponse*) override;

  ::grpc::Status Probe(::grpc::ServerContext*,
                       const x402::registry::v1::ProbeRequest*,
                       x402::registry::v1::ProbeResponse*) override;

private:
  ::grpc::Status CheckPaymentOrigin(const ::grpc::ServerContext* ctx,
                                    const x402::registry::v1::PaymentContext& payment,
                                    std::string_view route) const;

  std::shared_ptr<x402::service::RegistryService> service_;
  std::string gateway_token_;
};

}
