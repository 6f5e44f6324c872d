#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "internal/address/address.hpp"
#include "internal/auth/authorization_engine.hpp"
#include "internal/crypto/secp256k1.hpp"
#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/probe/endpoint_prober.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/challenge_guard.hpp"
#include "internal/store/registry_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"
#include "x402/registry/v1.hpp"

namespace {

using namespace std::chrono_literals;
using namespace x402::registry::v1;
using x402::address::Address;
using x402::address::Network;

constexpr const char* kWeatherUrl = "https://api.example.com/weather";

// Answers by url and method; anything unscripted is unreachable.
class RoutedHttpClient final : public x402::probe::HttpClient {
 public:
  void On(const std::string& url, const std::string& method, long status, std::string body = {}) {
    std::lock_guard lock(mutex_);
    x402::probe::HttpResponse r;
    r.status               = status;
    r.body                 = std::move(body);
    routes_[{url, method}] = std::move(r);
  }

  x402::probe::HttpResponse Send(const x402::probe::HttpRequest& request) override {
    std::lock_guard lock(mutex_);
    auto            it = routes_.find({request.url, request.method});
    if (it == routes_.end()) {
      x402::probe::HttpResponse down;
      down.error         = x402::probe::TransportError::Unreachable;
      down.error_message = "Could not resolve host";
      return down;
    }
    return it->second;
  }

 private:
  std::mutex                                                               mutex_;
  std::map<std::pair<std::string, std::string>, x402::probe::HttpResponse> routes_;
};

struct Identity {
  x402::crypto::PrivateKey key;
  std::string              address;
};

Identity NewIdentity() {
  Identity id;
  id.key     = x402::crypto::GeneratePrivateKey();
  id.address = Address::FromPublicKey(x402::crypto::DerivePublicKey(id.key), x402::address::version::kMainnetSingleSig).ToString();
  return id;
}

std::string X402Body(const std::string& pay_to) {
  return R"({"accepts":[{"scheme":"STX","maxAmountRequired":"1000","payTo":")" + pay_to + R"("}]})";
}

struct Harness {
  std::shared_ptr<x402::db::memory::MemoryKeyValueStore> kv     = std::make_shared<x402::db::memory::MemoryKeyValueStore>();
  std::shared_ptr<RoutedHttpClient>                      client = std::make_shared<RoutedHttpClient>();
  x402::service::ServiceContext                          ctx;
  std::unique_ptr<x402::service::RegistryService>        service;

  Identity owner = NewIdentity();
  Identity admin = NewIdentity();

  Harness() {
    ctx.challenges = std::make_shared<x402::store::ChallengeGuard>(kv, 5min);
    ctx.store      = std::make_shared<x402::store::RegistryStore>(kv, ctx.challenges);
    ctx.engine     = std::make_shared<x402::auth::AuthorizationEngine>(Network::Mainnet, x402::auth::Domain::ForNetwork(Network::Mainnet),
                                                                       x402::auth::ReplayWindow{});
    ctx.prober     = std::make_shared<x402::probe::EndpointProber>(client);
    ctx.settings.admin_address = admin.address;
    service                    = std::make_unique<x402::service::RegistryService>(ctx);

    client->On(kWeatherUrl, "POST", 402, X402Body(owner.address));
  }

  RegistryEntry Register(const std::string& url, const std::string& category = "data") {
    RegisterRequest req;
    req.set_url(url);
    req.set_name("Endpoint");
    req.set_description("Pay per call");
    req.set_owner(owner.address);
    req.set_category(category);
    return service->Register(req).entry();
  }

  SignatureBundle Sign(const Identity& signer, const std::string& action, const std::string& url, const std::string& nonce, uint64_t timestamp_ms,
                       const std::string& new_owner = {}) const {
    SignatureBundle bundle;
    auto*           payload = bundle.mutable_structured();
    payload->set_action(action);
    payload->set_owner(signer.address);
    payload->set_url(url);
    payload->set_nonce(nonce);
    payload->set_new_owner(new_owner);
    payload->set_timestamp(timestamp_ms);

    x402::auth::MessageFields fields;
    fields.owner = signer.address;
    if (!url.empty()) {
      fields.url = url;
    }
    if (!nonce.empty()) {
      fields.nonce = nonce;
    }
    if (!new_owner.empty()) {
      fields.new_owner = new_owner;
    }
    const auto message = x402::auth::BuildMessage(action, fields, timestamp_ms);
    const auto sig     = x402::crypto::SignRecoverable(x402::auth::StructuredDataHash(ctx.engine->domain(), message), signer.key);

    bundle.set_signature(x402::util::ToHex(sig.data(), sig.size()));
    return bundle;
  }
};

PaymentContext PaidBy(const std::string& payer) {
  PaymentContext payment;
  payment.set_settlement_json(R"({"success":true,"payer":")" + payer + R"(","txId":"0x01"})");
  return payment;
}

template <typename Error, typename Fn>
Error Expect(Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e;
  }
  assert(false && "expected an exception");
  throw std::logic_error("unreachable");
}

// Register an x402 endpoint: stored unverified with the probe's findings.
void TestRegisterConfirmedEndpoint() {
  Harness h;

  RegisterRequest req;
  req.set_url("HTTPS://API.example.com:443/weather/");
  req.set_name("Weather");
  req.set_description("Forecasts by the call");
  req.set_owner(h.owner.address);
  req.set_category(" Data ");
  req.add_tags("Forecast");
  req.add_tags(" ");

  const auto resp = h.service->Register(req);
  assert(resp.entry().url() == kWeatherUrl);
  assert(resp.entry().status() == ENTRY_STATUS_UNVERIFIED);
  assert(resp.entry().owner() == h.owner.address);
  assert(resp.entry().category() == "data");
  assert(resp.entry().tags_size() == 1 && resp.entry().tags(0) == "forecast");
  assert(resp.entry().has_probe_data());
  assert(resp.entry().probe_data().payment_address() == h.owner.address);
  assert(resp.entry().probe_data().prices().at("STX") == "1000");
  assert(resp.probe().is_x402_endpoint());
  assert(resp.probe().outcome() == "confirmed");

  // same url in another spelling
  req.set_url(kWeatherUrl);
  const auto dup = Expect<x402::util::AlreadyRegistered>([&]() { h.service->Register(req); });
  assert(dup.existing_id() == resp.entry().id());
}

void TestRegisterValidationAndProbeFailures() {
  Harness h;

  RegisterRequest req;
  req.set_url("https://api.example.com/down");
  req.set_name("Down");
  req.set_description("Nobody home");
  req.set_owner(h.owner.address);
  Expect<x402::util::ProbeFailed>([&]() { h.service->Register(req); });
  assert(!h.ctx.store->FindByUrl("https://api.example.com/down").has_value());

  req.set_url("http://10.0.0.7/internal");
  Expect<x402::util::InvalidArgument>([&]() { h.service->Register(req); });

  req.set_url("ftp://api.example.com/x");
  Expect<x402::util::InvalidArgument>([&]() { h.service->Register(req); });

  req.set_url(kWeatherUrl);
  req.set_name(std::string(101, 'n'));
  Expect<x402::util::InvalidArgument>([&]() { h.service->Register(req); });

  req.set_name("Weather");
  req.set_description("");
  Expect<x402::util::InvalidArgument>([&]() { h.service->Register(req); });

  req.set_description("ok");
  req.set_owner("SPNOTANADDRESS");
  Expect<x402::util::InvalidAddress>([&]() { h.service->Register(req); });

  // no owner and no payer
  req.clear_owner();
  Expect<x402::util::InvalidArgument>([&]() { h.service->Register(req); });
}

void TestRegisterNonX402EndpointWithoutProbeData() {
  Harness h;
  h.client->On("https://api.example.com/free", "POST", 200, "{}");
  h.client->On("https://api.example.com/free", "GET", 200, "{}");

  RegisterRequest req;
  req.set_url("https://api.example.com/free");
  req.set_name("Free");
  req.set_description("Costs nothing");
  req.set_owner(h.owner.address);

  const auto resp = h.service->Register(req);
  assert(!resp.entry().has_probe_data());
  assert(!resp.probe().is_x402_endpoint());
  assert(resp.probe().outcome() == "non-compliant");
}

void TestRegisterOwnerDefaultsToPayer() {
  Harness h;

  RegisterRequest req;
  req.set_url(kWeatherUrl);
  req.set_name("Weather");
  req.set_description("Forecasts");
  const auto testnet_payer = Address::FromPublicKey(x402::crypto::DerivePublicKey(h.owner.key), x402::address::version::kTestnetSingleSig).ToString();
  *req.mutable_payment() = PaidBy(testnet_payer);

  const auto entry = h.service->Register(req).entry();
  assert(entry.owner() == h.owner.address);
  assert(entry.registered_by() == h.owner.address);
}

// Update authorized by the payment origin alone.
void TestUpdateByPayment() {
  Harness    h;
  const auto entry = h.Register(kWeatherUrl);
  std::this_thread::sleep_for(5ms);

  UpdateRequest req;
  req.set_url(kWeatherUrl);
  req.set_description("Hourly forecasts");
  *req.mutable_payment() = PaidBy(h.owner.address);

  const auto resp = h.service->Update(req);
  assert(resp.auth().method() == "payment");
  assert(resp.entry().description() == "Hourly forecasts");
  assert(resp.entry().name() == entry.name());
  assert(x402::util::FromProto(resp.entry().updated_at()) > x402::util::FromProto(entry.updated_at()));

  // a stranger's payment does not
  *req.mutable_payment() = PaidBy(NewIdentity().address);
  const auto denied      = Expect<x402::util::NotAuthorized>([&]() { h.service->Update(req); });
  assert(denied.reason() == "address mismatch");
}

void TestUpdateBySignatureWithReprobe() {
  Harness h;
  h.Register(kWeatherUrl);

  UpdateRequest req;
  req.set_url(kWeatherUrl);
  req.mutable_tags()->add_values("Hourly");
  req.set_reprobe(true);
  *req.mutable_signature() = h.Sign(h.owner, "update-endpoint", kWeatherUrl, "", x402::util::ToUnixMillis(x402::util::Now()));

  const auto resp = h.service->Update(req);
  assert(resp.auth().method() == "signature");
  assert(resp.entry().tags_size() == 1 && resp.entry().tags(0) == "hourly");
  assert(resp.probe().is_x402_endpoint());

  UpdateRequest none;
  none.set_url(kWeatherUrl);
  Expect<x402::util::NotAuthorized>([&]() { h.service->Update(none); });

  none.set_url("https://api.example.com/missing");
  Expect<x402::util::EntryNotFound>([&]() { h.service->Update(none); });
}

// A transfer signed ten minutes ago against a challenge issued then is refused as expired.
void TestStaleTransferIsRefused() {
  Harness    h;
  const auto recipient = NewIdentity();
  h.Register(kWeatherUrl);

  const auto issued    = x402::util::Now() - 10min;
  const auto challenge = h.ctx.challenges->Issue(h.owner.address, x402::auth::ActionKind::TransferOwnership, issued);

  TransferRequest req;
  req.set_url(kWeatherUrl);
  req.set_owner(h.owner.address);
  req.set_new_owner(recipient.address);
  *req.mutable_signature() = h.Sign(h.owner, "transfer-ownership", kWeatherUrl, challenge.id(), x402::util::ToUnixMillis(issued), recipient.address);

  const auto denied = Expect<x402::util::NotAuthorized>([&]() { h.service->Transfer(req); });
  assert(denied.reason() == "timestamp expired");
  assert(h.ctx.store->FindByUrl(kWeatherUrl)->owner() == h.owner.address);
}

void TestTransferWithFreshChallenge() {
  Harness    h;
  const auto recipient = NewIdentity();
  const auto entry     = h.Register(kWeatherUrl);

  RequestChallengeRequest creq;
  creq.set_owner(h.owner.address);
  creq.set_action("transfer-ownership");
  creq.set_url(kWeatherUrl);
  creq.set_new_owner(recipient.address);
  const auto challenge = h.service->RequestChallenge(creq);

  TransferRequest req;
  req.set_url(kWeatherUrl);
  req.set_new_owner(recipient.address);
  *req.mutable_signature() = h.Sign(h.owner, "transfer-ownership", kWeatherUrl, challenge.challenge_id(), challenge.timestamp(), recipient.address);

  const auto resp = h.service->Transfer(req);
  assert(resp.previous_owner() == h.owner.address);
  assert(resp.entry().owner() == recipient.address);
  assert(resp.entry().id() == entry.id());

  DetailsRequest dreq;
  dreq.mutable_ref()->set_owner(recipient.address);
  dreq.mutable_ref()->set_id(entry.id());
  assert(h.service->Details(dreq).entry().url() == kWeatherUrl);

  // to yourself
  TransferRequest self;
  self.set_url(kWeatherUrl);
  self.set_new_owner(recipient.address);
  self.set_owner(recipient.address);
  Expect<x402::util::InvalidArgument>([&]() { h.service->Transfer(self); });
}

// Delete with a fresh challenge; replaying the same request is refused.
void TestDeleteThenReplay() {
  Harness    h;
  const auto entry = h.Register(kWeatherUrl);

  RequestChallengeRequest creq;
  creq.set_owner(h.owner.address);
  creq.set_action("delete-endpoint");
  creq.set_url(kWeatherUrl);
  const auto challenge = h.service->RequestChallenge(creq);
  assert(challenge.action() == "delete-endpoint");
  assert(challenge.domain_hex() == x402::util::ToHex(h.ctx.engine->domain().Serialize()));

  x402::auth::MessageFields fields;
  fields.owner = h.owner.address;
  fields.url   = kWeatherUrl;
  fields.nonce = challenge.challenge_id();
  assert(challenge.message_hex() == x402::util::ToHex(x402::auth::BuildMessage("delete-endpoint", fields, challenge.timestamp()).Serialize()));

  DeleteRequest req;
  req.set_url(kWeatherUrl);
  req.set_owner(h.owner.address);
  *req.mutable_signature() = h.Sign(h.owner, "delete-endpoint", kWeatherUrl, challenge.challenge_id(), challenge.timestamp());

  const auto resp = h.service->Delete(req);
  assert(resp.id() == entry.id());
  assert(!h.ctx.store->FindByUrl(kWeatherUrl).has_value());

  const auto replay = Expect<x402::util::NotAuthorized>([&]() { h.service->Delete(req); });
  assert(replay.reason() == "challenge invalid or consumed");
}

void TestDeleteRefusals() {
  Harness    h;
  const auto intruder = NewIdentity();
  h.Register(kWeatherUrl);

  RequestChallengeRequest creq;
  creq.set_owner(h.owner.address);
  creq.set_action("delete-endpoint");
  creq.set_url(kWeatherUrl);
  const auto challenge = h.service->RequestChallenge(creq);

  // payment is not enough for a delete
  DeleteRequest paid;
  paid.set_url(kWeatherUrl);
  *paid.mutable_payment() = PaidBy(h.owner.address);
  assert(Expect<x402::util::NotAuthorized>([&]() { h.service->Delete(paid); }).reason() == "no proof supplied");

  // someone else's key over the owner's challenge
  DeleteRequest forged;
  forged.set_url(kWeatherUrl);
  forged.set_owner(intruder.address);
  *forged.mutable_signature() = h.Sign(intruder, "delete-endpoint", kWeatherUrl, challenge.challenge_id(), challenge.timestamp());
  assert(Expect<x402::util::NotAuthorized>([&]() { h.service->Delete(forged); }).reason() == "address mismatch");

  // the challenge survives the refusals
  assert(h.ctx.challenges->Lookup(h.owner.address, challenge.challenge_id()).has_value());
  assert(h.ctx.store->FindByUrl(kWeatherUrl).has_value());

  creq.set_action("update-endpoint");
  Expect<x402::util::InvalidArgument>([&]() { h.service->RequestChallenge(creq); });
  creq.set_action("rename-endpoint");
  Expect<x402::util::UnknownAction>([&]() { h.service->RequestChallenge(creq); });
}

void TestMyEndpoints() {
  Harness h;
  h.client->On("https://api.example.com/a", "POST", 402);
  h.client->On("https://api.example.com/b", "POST", 402);
  h.Register("https://api.example.com/a");
  std::this_thread::sleep_for(2ms);
  h.Register("https://api.example.com/b");

  MyEndpointsRequest req;
  req.set_owner(h.owner.address);
  *req.mutable_signature() = h.Sign(h.owner, "list-my-endpoints", "", "", x402::util::ToUnixMillis(x402::util::Now()));

  auto resp = h.service->MyEndpoints(req);
  assert(resp.entries_size() == 2);
  assert(resp.entries(0).url() == "https://api.example.com/b");
  assert(resp.auth().method() == "signature");

  req.clear_signature();
  *req.mutable_payment() = PaidBy(h.owner.address);
  resp                   = h.service->MyEndpoints(req);
  assert(resp.auth().method() == "payment");

  req.clear_payment();
  Expect<x402::util::NotAuthorized>([&]() { h.service->MyEndpoints(req); });
}

void TestListPagination() {
  Harness h;
  for (int i = 0; i < 5; ++i) {
    const auto url = "https://api.example.com/e" + std::to_string(i);
    h.client->On(url, "POST", 402);
    h.Register(url, i % 2 == 0 ? "data" : "ai");
    std::this_thread::sleep_for(2ms);
  }

  ListRequest req;
  req.set_limit(2);
  auto page = h.service->List(req);
  assert(page.total() == 5);
  assert(page.entries_size() == 2);
  assert(page.has_more());
  assert(page.entries(0).url() == "https://api.example.com/e4");

  req.set_offset(4);
  page = h.service->List(req);
  assert(page.entries_size() == 1);
  assert(!page.has_more());
  assert(page.entries(0).url() == "https://api.example.com/e0");

  req.set_offset(10);
  assert(h.service->List(req).entries_size() == 0);

  ListRequest all;
  all.set_limit(1000);
  assert(h.service->List(all).entries_size() == 5);

  ListRequest ai;
  ai.set_category(" AI");
  page = h.service->List(ai);
  assert(page.total() == 2);

  ListRequest verified;
  verified.set_status(ENTRY_STATUS_VERIFIED);
  assert(h.service->List(verified).total() == 0);
}

void TestDetailsWithLiveProbe() {
  Harness h;
  h.Register(kWeatherUrl);

  DetailsRequest req;
  req.set_url(kWeatherUrl);
  req.set_live_probe(true);
  const auto resp = h.service->Details(req);
  assert(resp.entry().url() == kWeatherUrl);
  assert(resp.has_live());
  assert(resp.live().is_online());

  DetailsRequest plain;
  plain.set_url(kWeatherUrl);
  assert(!h.service->Details(plain).has_live());

  DetailsRequest missing;
  missing.mutable_ref()->set_owner(h.owner.address);
  missing.mutable_ref()->set_id("no-such-id");
  Expect<x402::util::EntryNotFound>([&]() { h.service->Details(missing); });

  Expect<x402::util::InvalidArgument>([&]() { h.service->Details(DetailsRequest{}); });
}

void TestAdminReview() {
  Harness h;
  h.Register(kWeatherUrl);
  h.client->On("https://api.example.com/free", "POST", 200);
  h.client->On("https://api.example.com/free", "GET", 200);
  h.Register("https://api.example.com/free");

  AdminPendingRequest pending;
  *pending.mutable_payment() = PaidBy(h.admin.address);
  assert(h.service->AdminPending(pending).entries_size() == 2);

  AdminVerifyRequest verify;
  verify.set_url(kWeatherUrl);
  verify.set_action("verify");
  *verify.mutable_payment() = PaidBy(h.admin.address);
  assert(h.service->AdminVerify(verify).entry().status() == ENTRY_STATUS_VERIFIED);
  assert(h.service->AdminPending(pending).entries_size() == 1);

  // nothing to verify without probe data
  verify.set_url("https://api.example.com/free");
  Expect<x402::util::InvalidArgument>([&]() { h.service->AdminVerify(verify); });

  verify.set_url(kWeatherUrl);
  verify.set_action("reject");
  assert(h.service->AdminVerify(verify).entry().status() == ENTRY_STATUS_UNVERIFIED);

  verify.set_action("promote");
  Expect<x402::util::InvalidArgument>([&]() { h.service->AdminVerify(verify); });

  verify.set_action("verify");
  *verify.mutable_payment() = PaidBy(h.owner.address);
  Expect<x402::util::NotAuthorized>([&]() { h.service->AdminVerify(verify); });

  AdminPendingRequest anonymous;
  Expect<x402::util::NotAuthorized>([&]() { h.service->AdminPending(anonymous); });
}

// Caller mistakes are warnings; the error level is left for server faults.
void TestClientErrorsLogAsWarnings() {
  Harness h;
  h.Register(kWeatherUrl);

  std::ostringstream captured;
  auto               previous = spdlog::default_logger();
  auto               capture  = std::make_shared<spdlog::logger>("capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
  capture->set_pattern("%l %v");
  capture->set_level(spdlog::level::debug);
  spdlog::set_default_logger(capture);

  Expect<x402::util::AlreadyRegistered>([&]() { h.Register(kWeatherUrl); });

  DetailsRequest missing;
  missing.set_url("https://api.example.com/missing");
  Expect<x402::util::EntryNotFound>([&]() { h.service->Details(missing); });

  RegisterRequest unnamed;
  unnamed.set_url("https://api.example.com/unnamed");
  unnamed.set_description("Pay per call");
  unnamed.set_owner(h.owner.address);
  Expect<x402::util::InvalidArgument>([&]() { h.service->Register(unnamed); });

  spdlog::set_default_logger(previous);

  const auto text = captured.str();
  assert(text.find("warning request rejected route=Register") != std::string::npos);
  assert(text.find("warning request rejected route=Details") != std::string::npos);
  assert(text.find("RPC failed") == std::string::npos);

  std::istringstream lines(text);
  for (std::string line; std::getline(lines, line);) {
    assert(line.rfind("error ", 0) != 0);
  }
}

void TestProbeRpc() {
  Harness h;

  ProbeRequest req;
  req.set_url(kWeatherUrl);
  auto report = h.service->Probe(req).report();
  assert(report.is_x402_endpoint());
  assert(report.data().payment_address() == h.owner.address);

  req.set_url("http://localhost:3000/x");
  report = h.service->Probe(req).report();
  assert(!report.is_x402_endpoint());
  assert(report.outcome() == "rejected");
  assert(report.error() == "Cannot probe localhost");

  Expect<x402::util::InvalidArgument>([&]() { h.service->Probe(ProbeRequest{}); });
}

} // namespace

int main() {
  TestRegisterConfirmedEndpoint();
  TestRegisterValidationAndProbeFailures();
  TestRegisterNonX402EndpointWithoutProbeData();
  TestRegisterOwnerDefaultsToPayer();
  TestUpdateByPayment();
  TestUpdateBySignatureWithReprobe();
  TestStaleTransferIsRefused();
  TestTransferWithFreshChallenge();
  TestDeleteThenReplay();
  TestDeleteRefusals();
  TestMyEndpoints();
  TestListPagination();
  TestDetailsWithLiveProbe();
  TestAdminReview();
  TestProbeRpc();
  TestClientErrorsLogAsWarnings();

  std::cout << "x402_integration_registry_service: pass\n";
  return 0;
}
