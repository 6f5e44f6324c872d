#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/auth/authorization_engine.hpp"
#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/probe/endpoint_prober.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/challenge_guard.hpp"
#include "internal/store/registry_store.hpp"
#include "internal/util/errors.hpp"
#include "x402/registry/v1.hpp"

namespace {

using namespace x402::registry::v1;

constexpr const char* kOwner        = "SP2J6ZY48GV1EZ5V2V5RB9MP66SW86PYKKNRV9EJ7";
constexpr const char* kAdmin        = "SP1THWXQ8368SDN2MJGE4BMDKMCHZ2GSVTS1X0BPM";
constexpr const char* kGatewayToken = "gw-secret";
constexpr const char* kWeatherUrl   = "https://api.example.com/weather";

class PaymentRequiredClient final : public x402::probe::HttpClient {
 public:
  x402::probe::HttpResponse Send(const x402::probe::HttpRequest&) override {
    x402::probe::HttpResponse r;
    r.status = 402;
    return r;
  }
};

x402::service::ServiceContext BuildServiceContext() {
  auto kv = std::make_shared<x402::db::memory::MemoryKeyValueStore>();

  x402::service::ServiceContext ctx;
  ctx.challenges = std::make_shared<x402::store::ChallengeGuard>(kv, std::chrono::minutes(5));
  ctx.store      = std::make_shared<x402::store::RegistryStore>(kv, ctx.challenges);
  ctx.engine     = std::make_shared<x402::auth::AuthorizationEngine>(x402::address::Network::Mainnet,
                                                                     x402::auth::Domain::ForNetwork(x402::address::Network::Mainnet), x402::auth::ReplayWindow{});
  ctx.prober     = std::make_shared<x402::probe::EndpointProber>(std::make_shared<PaymentRequiredClient>());
  ctx.settings.admin_address = kAdmin;
  return ctx;
}

PaymentContext PaidBy(const std::string& payer) {
  PaymentContext payment;
  payment.set_settlement_json(R"({"success":true,"payer":")" + payer + R"(","txId":"0x01"})");
  return payment;
}

RegisterRequest WeatherRegistration() {
  RegisterRequest req;
  req.set_url(kWeatherUrl);
  req.set_name("Weather");
  req.set_description("Forecasts");
  req.set_owner(kOwner);
  return req;
}

void TestExceptionMapping() {
  using x402::grpc::ToStatus;

  assert(ToStatus(x402::util::InvalidArgument("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(x402::util::InvalidAddress("bad address")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(x402::util::UnknownAction("drop")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(x402::util::EntryNotFound("gone")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(x402::util::StorageConflict("race")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(x402::util::ProbeFailed("down")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto existing = ToStatus(x402::util::AlreadyRegistered("taken", "entry-1", kOwner));
  assert(existing.error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(existing.error_details() == "entry-1");

  const auto denied = ToStatus(x402::util::NotAuthorized("timestamp expired", "too old"));
  assert(denied.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(denied.error_message().rfind("timestamp expired", 0) == 0);
}

void TestDetailsForMissingEntryReturnsNotFound() {
  auto                       service = std::make_shared<x402::service::RegistryService>(BuildServiceContext());
  x402::grpc::RegistryServer server(service);

  DetailsRequest req;
  req.set_url("https://api.example.com/missing");
  DetailsResponse       resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Details(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestDuplicateRegisterReturnsAlreadyExists() {
  auto                       service = std::make_shared<x402::service::RegistryService>(BuildServiceContext());
  x402::grpc::RegistryServer server(service);

  RegisterRequest req;
  req.set_url("https://api.example.com/weather");
  req.set_name("Weather");
  req.set_description("Forecasts");
  req.set_owner(kOwner);

  RegisterResponse      resp;
  ::grpc::ServerContext first_ctx;
  assert(server.Register(&first_ctx, &req, &resp).ok());
  assert(!resp.entry().id().empty());

  RegisterResponse      again;
  ::grpc::ServerContext second_ctx;
  const auto            status = server.Register(&second_ctx, &req, &again);
  assert(status.error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(status.error_details() == resp.entry().id());
}

void TestUpdateWithoutProofReturnsPermissionDenied() {
  auto                       service = std::make_shared<x402::service::RegistryService>(BuildServiceContext());
  x402::grpc::RegistryServer server(service);

  RegisterRequest reg;
  reg.set_url("https://api.example.com/weather");
  reg.set_name("Weather");
  reg.set_description("Forecasts");
  reg.set_owner(kOwner);
  RegisterResponse      reg_resp;
  ::grpc::ServerContext reg_ctx;
  assert(server.Register(&reg_ctx, &reg, &reg_resp).ok());

  UpdateRequest req;
  req.set_url("https://api.example.com/weather");
  req.set_description("Changed");
  UpdateResponse        resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Update(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

void TestBadInputReturnsInvalidArgument() {
  auto                       service = std::make_shared<x402::service::RegistryService>(BuildServiceContext());
  x402::grpc::RegistryServer server(service);

  RequestChallengeRequest req;
  req.set_owner(kOwner);
  req.set_action("rename-endpoint");
  req.set_url("https://api.example.com/weather");
  RequestChallengeResponse resp;
  ::grpc::ServerContext    grpc_ctx;
  assert(server.RequestChallenge(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_action("delete-endpoint");
  req.set_owner("not-an-address");
  ::grpc::ServerContext second_ctx;
  assert(server.RequestChallenge(&second_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

// Callers without the gateway token cannot vouch for a payment, whoever it names.
void TestForgedPaymentContextIsRefused() {
  auto                       service = std::make_shared<x402::service::RegistryService>(BuildServiceContext());
  x402::grpc::RegistryServer server(service, kGatewayToken);

  const auto            reg = WeatherRegistration();
  RegisterResponse      reg_resp;
  ::grpc::ServerContext reg_ctx;
  assert(server.Register(&reg_ctx, &reg, &reg_resp).ok());

  UpdateRequest update;
  update.set_url(kWeatherUrl);
  update.set_description("defaced");
  *update.mutable_payment() = PaidBy(kOwner);
  UpdateResponse        update_resp;
  ::grpc::ServerContext update_ctx;
  assert(server.Update(&update_ctx, &update, &update_resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);

  AdminVerifyRequest verify;
  verify.set_url(kWeatherUrl);
  verify.set_action("verify");
  *verify.mutable_payment() = PaidBy(kAdmin);
  AdminVerifyResponse   verify_resp;
  ::grpc::ServerContext verify_ctx;
  assert(server.AdminVerify(&verify_ctx, &verify, &verify_resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);

  DetailsRequest details;
  details.set_url(kWeatherUrl);
  DetailsResponse       details_resp;
  ::grpc::ServerContext details_ctx;
  assert(server.Details(&details_ctx, &details, &details_resp).ok());
  assert(details_resp.entry().description() == "Forecasts");
  assert(details_resp.entry().status() == ENTRY_STATUS_UNVERIFIED);

  // with no token configured nobody is trusted
  x402::grpc::RegistryServer closed(service);
  ::grpc::ServerContext      closed_ctx;
  assert(closed.AdminVerify(&closed_ctx, &verify, &verify_resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

// Over a real channel the token travels as metadata.
void TestGatewayTokenAdmitsPaymentContext() {
  auto                       service = std::make_shared<x402::service::RegistryService>(BuildServiceContext());
  x402::grpc::RegistryServer registry(service, kGatewayToken);

  ::grpc::ServerBuilder builder;
  builder.RegisterService(&registry);
  auto server = builder.BuildAndStart();
  assert(server);
  auto stub = x402::registry::v1::RegistryService::NewStub(server->InProcessChannel(::grpc::ChannelArguments()));

  RegisterResponse      reg_resp;
  ::grpc::ClientContext reg_ctx;
  assert(stub->Register(&reg_ctx, WeatherRegistration(), &reg_resp).ok());

  UpdateRequest update;
  update.set_url(kWeatherUrl);
  update.set_description("Hourly forecasts");
  *update.mutable_payment() = PaidBy(kOwner);

  UpdateResponse        resp;
  ::grpc::ClientContext anonymous;
  assert(stub->Update(&anonymous, update, &resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);

  ::grpc::ClientContext wrong;
  wrong.AddMetadata(x402::grpc::kGatewayTokenHeader, "gw-secreT");
  assert(stub->Update(&wrong, update, &resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);

  ::grpc::ClientContext gateway;
  gateway.AddMetadata(x402::grpc::kGatewayTokenHeader, kGatewayToken);
  const auto status = stub->Update(&gateway, update, &resp);
  assert(status.ok());
  assert(resp.auth().method() == "payment");
  assert(resp.entry().description() == "Hourly forecasts");

  server->Shutdown();
}

} // namespace

int main() {
  TestExceptionMapping();
  TestDetailsForMissingEntryReturnsNotFound();
  TestDuplicateRegisterReturnsAlreadyExists();
  TestUpdateWithoutProofReturnsPermissionDenied();
  TestBadInputReturnsInvalidArgument();
  TestForgedPaymentContextIsRefused();
  TestGatewayTokenAdmitsPaymentContext();

  std::cout << "x402_unit_grpc_status: pass\n";
  return 0;
}
