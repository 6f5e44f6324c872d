#include "registry_server.hpp"

#include <openssl/crypto.h>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "x402/registry/v1.hpp"

namespace x402::grpc {

namespace {

bool Supplied(const x402::registry::v1::PaymentContext& payment) {
  return !payment.settlement_json().empty() || !payment.signed_transaction_hex().empty();
}

}

RegistryServer::RegistryServer(std::shared_ptr<x402::service::RegistryService> svc, std::string gateway_token)
    : service_(std::move(svc)), gateway_token_(std::move(gateway_token)) {}

// A payment context is only believed when the caller presents the gateway token.
::grpc::Status RegistryServer::CheckPaymentOrigin(const ::grpc::ServerContext* ctx,
                                                  const x402::registry::v1::PaymentContext& payment,
                                                  std::string_view route) const {
  if (!Supplied(payment)) {
    return ::grpc::Status::OK;
  }

  if (!gateway_token_.empty()) {
    const auto& metadata = ctx->client_metadata();
    const auto  found    = metadata.find(kGatewayTokenHeader);
    if (found != metadata.end() && found->second.size() == gateway_token_.size() &&
        CRYPTO_memcmp(found->second.data(), gateway_token_.data(), gateway_token_.size()) == 0) {
      return ::grpc::Status::OK;
    }
  }

  REGISTRY_LOG_WARN("payment context from unauthenticated caller refused", {observability::StringField("route", route)});
  return ::grpc::Status(::grpc::StatusCode::PERMISSION_DENIED, "payment context is accepted only from the authenticated x402 gateway");
}

::grpc::Status RegistryServer::Register(::grpc::ServerContext* ctx,
                                        const x402::registry::v1::RegisterRequest* req,
                                        x402::registry::v1::RegisterResponse* resp) {
  if (auto origin = CheckPaymentOrigin(ctx, req->payment(), "register"); !origin.ok()) {
    return origin;
  }
  try {
    *resp = service_->Register(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Update(::grpc::ServerContext* ctx,
                                      const x402::registry::v1::UpdateRequest* req,
                                      x402::registry::v1::UpdateResponse* resp) {
  if (auto origin = CheckPaymentOrigin(ctx, req->payment(), "update"); !origin.ok()) {
    return origin;
  }
  try {
    *resp = service_->Update(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Delete(::grpc::ServerContext* ctx,
                                      const x402::registry::v1::DeleteRequest* req,
                                      x402::registry::v1::DeleteResponse* resp) {
  if (auto origin = CheckPaymentOrigin(ctx, req->payment(), "delete"); !origin.ok()) {
    return origin;
  }
  try {
    *resp = service_->Delete(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Transfer(::grpc::ServerContext* ctx,
                                        const x402::registry::v1::TransferRequest* req,
                                        x402::registry::v1::TransferResponse* resp) {
  if (auto origin = CheckPaymentOrigin(ctx, req->payment(), "transfer"); !origin.ok()) {
    return origin;
  }
  try {
    *resp = service_->Transfer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::RequestChallenge(::grpc::ServerContext*,
                                                const x402::registry::v1::RequestChallengeRequest* req,
                                                x402::registry::v1::RequestChallengeResponse* resp) {
  try {
    *resp = service_->RequestChallenge(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::MyEndpoints(::grpc::ServerContext* ctx,
                                           const x402::registry::v1::MyEndpointsRequest* req,
                                           x402::registry::v1::MyEndpointsResponse* resp) {
  if (auto origin = CheckPaymentOrigin(ctx, req->payment(), "my-endpoints"); !origin.ok()) {
    return origin;
  }
  try {
    *resp = service_->MyEndpoints(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Details(::grpc::ServerContext*,
                                       const x402::registry::v1::DetailsRequest* req,
                                       x402::registry::v1::DetailsResponse* resp) {
  try {
    *resp = service_->Details(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::List(::grpc::ServerContext*,
                                    const x402::registry::v1::ListRequest* req,
                                    x402::registry::v1::ListResponse* resp) {
  try {
    *resp = service_->List(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::AdminPending(::grpc::ServerContext* ctx,
                                            const x402::registry::v1::AdminPendingRequest* req,
                                            x402::registry::v1::AdminPendingResponse* resp) {
  if (auto origin = CheckPaymentOrigin(ctx, req->payment(), "admin-pending"); !origin.ok()) {
    return origin;
  }
  try {
    *resp = service_->AdminPending(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::AdminVerify(::grpc::ServerContext* ctx,
                                           const x402::registry::v1::AdminVerifyRequest* req,
                                           x402::registry::v1::AdminVerifyResponse* resp) {
  if (auto origin = CheckPaymentOrigin(ctx, req->payment(), "admin-verify"); !origin.ok()) {
    return origin;
  }
  try {
    *resp = service_->AdminVerify(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Probe(::grpc::ServerContext*,
                                     const x402::registry::v1::ProbeRequest* req,
                                     x402::registry::v1::ProbeResponse* resp) {
  try {
    *resp = service_->Probe(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
