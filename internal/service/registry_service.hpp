#pragma once

#include "service_context.hpp"
#include "x402/registry/v1.hpp"

namespace x402::service {

/*
  Registry operations over proto requests.

  Authorization is decided by the AuthorizationEngine before any mutation; denials
  surface as util::NotAuthorized carrying the reason text.
*/
class RegistryService {
public:
  explicit RegistryService(ServiceContext ctx);

  x402::registry::v1::RegisterResponse
  Register(const x402::registry::v1::RegisterRequest& req);

  x402::registry::v1::UpdateResponse
  Update(const x402::registry::v1::UpdateRequest& req);

  x402::registry::v1::DeleteResponse
  Delete(const x402::registry::v1::DeleteRequest& req);

  x402::registry::v1::TransferResponse
  Transfer(const x402::registry::v1::TransferRequest& req);

  x402::registry::v1::RequestChallengeResponse
  RequestChallenge(const x402::registry::v1::RequestChallengeRequest& req);

  x402::registry::v1::MyEndpointsResponse
  MyEndpoints(const x402::registry::v1::MyEndpointsRequest& req);

  x402::registry::v1::DetailsResponse
  Details(const x402::registry::v1::DetailsRequest& req);

  x402::registry::v1::ListResponse
  List(const x402::registry::v1::ListRequest& req);

  x402::registry::v1::AdminPendingResponse
  AdminPending(const x402::registry::v1::AdminPendingRequest& req);

  x402::registry::v1::AdminVerifyResponse
  AdminVerify(const x402::registry::v1::AdminVerifyRequest& req);

  x402::registry::v1::ProbeResponse
  Probe(const x402::registry::v1::ProbeRequest& req);

private:
  void RequireAdmin(const x402::registry::v1::PaymentContext& payment) const;

  ServiceContext ctx_;
};

}
