#include "registry_service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "internal/auth/authorization_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/endpoint_prober.hpp"
#include "internal/store/challenge_guard.hpp"
#include "internal/store/keys.hpp"
#include "internal/store/registry_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"
#include "internal/util/url.hpp"

namespace x402::service {

using namespace x402::registry::v1;

namespace {

constexpr std::size_t kMaxNameLength        = 100;
constexpr std::size_t kMaxDescriptionLength = 500;
constexpr uint32_t    kDefaultListLimit     = 50;
constexpr uint32_t    kMaxListLimit         = 100;

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    REGISTRY_LOG_DEBUG("RPC completed", {observability::StringField("route", route), observability::IntField("elapsed_ms", elapsed_ms())});
    return result;
  } catch (const util::NotAuthorized& ex) {
    REGISTRY_LOG_WARN("request denied", {observability::StringField("route", route), observability::StringField("reason", ex.reason()),
                                         observability::StringField("error", ex.what())});
    throw;
  } catch (const util::InvalidArgument& ex) {
    REGISTRY_LOG_WARN("request rejected", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    throw;
  } catch (const util::AlreadyRegistered& ex) {
    REGISTRY_LOG_WARN("request rejected", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    throw;
  } catch (const util::EntryNotFound& ex) {
    REGISTRY_LOG_WARN("request rejected", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    throw;
  } catch (const std::exception& ex) {
    REGISTRY_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                      observability::IntField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

std::string TrimLower(std::string_view value) {
  auto begin = std::find_if(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); });
  auto end   = std::find_if(value.rbegin(), value.rend(), [](unsigned char c) { return !std::isspace(c); }).base();

  std::string out = begin < end ? std::string(begin, end) : std::string();
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::vector<std::string> NormalizeTags(const google::protobuf::RepeatedPtrField<std::string>& tags) {
  std::vector<std::string> out;
  for (const auto& tag : tags) {
    auto normalized = TrimLower(tag);
    if (!normalized.empty()) {
      out.push_back(std::move(normalized));
    }
  }
  return out;
}

void ValidateName(const std::string& name) {
  if (name.empty()) {
    throw util::InvalidArgument("name is required");
  }
  if (name.size() > kMaxNameLength) {
    throw util::InvalidArgument("name must be at most " + std::to_string(kMaxNameLength) + " characters");
  }
}

void ValidateDescription(const std::string& description) {
  if (description.empty()) {
    throw util::InvalidArgument("description is required");
  }
  if (description.size() > kMaxDescriptionLength) {
    throw util::InvalidArgument("description must be at most " + std::to_string(kMaxDescriptionLength) + " characters");
  }
}

std::string RequireUrl(const std::string& url) {
  if (url.empty()) {
    throw util::InvalidArgument("url is required");
  }
  auto normalized = util::NormalizeUrl(url);
  if (!normalized) {
    throw util::InvalidArgument("invalid url: " + url);
  }
  return *normalized;
}

std::string RequireOwner(const std::string& owner, address::Network network, std::string_view field = "owner") {
  if (owner.empty()) {
    throw util::InvalidArgument(std::string(field) + " is required");
  }
  return store::keys::CanonicalOwner(owner, network);
}

auth::PaymentProof ToPaymentProof(const PaymentContext& payment) {
  auth::PaymentProof proof;
  if (!payment.settlement_json().empty()) {
    proof.settlement = auth::SettlementOutcome::FromJson(payment.settlement_json());
  }
  if (!payment.signed_transaction_hex().empty()) {
    proof.signed_transaction = auth::PaymentProof::FromSignedTransactionHex(payment.signed_transaction_hex()).signed_transaction;
  }
  return proof;
}

// Payer in the configured network's form, when the payment names one.
std::optional<std::string> PayerAddress(const auth::PaymentProof& proof, address::Network network) {
  if (proof.settlement && proof.settlement->payer_address && address::Address::TryParse(*proof.settlement->payer_address)) {
    return store::keys::CanonicalOwner(*proof.settlement->payer_address, network);
  }
  if (auto fingerprint = auth::PayerFingerprint(proof)) {
    return address::Address::FromFingerprint(*fingerprint, address::SingleSigVersion(network)).ToString();
  }
  return std::nullopt;
}

std::optional<auth::SignatureProof> ToSignatureProof(const SignatureBundle& bundle) {
  if (bundle.signature().empty()) {
    return std::nullopt;
  }

  auth::SignatureProof proof;
  proof.signature        = bundle.signature();
  proof.expected_address = bundle.expected_address();

  switch (bundle.payload_case()) {
    case SignatureBundle::kStructured: {
      const auto& payload = bundle.structured();

      auth::MessageFields fields;
      fields.owner = payload.owner();
      if (!payload.url().empty()) {
        fields.url = payload.url();
      }
      if (!payload.new_owner().empty()) {
        fields.new_owner = payload.new_owner();
      }
      if (!payload.nonce().empty()) {
        fields.nonce = payload.nonce();
      }

      proof.mode    = auth::SignatureMode::Structured;
      proof.message = auth::BuildMessage(payload.action(), fields, payload.timestamp());
      if (proof.expected_address.empty()) {
        proof.expected_address = payload.owner();
      }
      break;
    }
    case SignatureBundle::kSimpleMessage:
      proof.mode        = auth::SignatureMode::Simple;
      proof.raw_message = bundle.simple_message();
      break;
    case SignatureBundle::PAYLOAD_NOT_SET:
      throw util::InvalidArgument("signature carries neither a structured payload nor a message");
  }
  return proof;
}

void ThrowIfDenied(const auth::AuthorizationDecision& decision) {
  if (decision) {
    return;
  }
  const auto reason = decision.reason.value_or(auth::DenyReason::NoProofSupplied);
  throw util::NotAuthorized(std::string(auth::DenyReasonText(reason)), decision.detail);
}

// The owner named by a request, checked against the stored owner. Empty means "the stored owner".
void CheckClaimedOwner(const std::string& claimed, const RegistryEntry& entry) {
  if (!claimed.empty() && !address::Equivalent(claimed, entry.owner())) {
    throw util::NotAuthorized(std::string(auth::DenyReasonText(auth::DenyReason::AddressMismatch)), "entry is not owned by " + claimed);
  }
}

/*
  Owner a destructive request is authorized against: the stored owner when the entry
  exists, otherwise the owner the caller claims. Authorization runs before a missing
  entry is reported.
*/
std::string ResolveOwner(const std::optional<RegistryEntry>& entry, const std::string& claimed, const std::optional<auth::SignatureProof>& signature,
                         const std::string& url, address::Network network) {
  if (entry) {
    CheckClaimedOwner(claimed, *entry);
    return entry->owner();
  }
  if (!claimed.empty() && address::Address::TryParse(claimed)) {
    return store::keys::CanonicalOwner(claimed, network);
  }
  if (signature && signature->message && address::Address::TryParse(signature->message->owner)) {
    return store::keys::CanonicalOwner(signature->message->owner, network);
  }
  throw util::EntryNotFound("endpoint not found: " + url);
}

// Fills the request's challenge view; the ticket is what the store consumes.
std::optional<store::ChallengeTicket> LookupChallenge(store::ChallengeGuard& challenges, auth::AuthorizationRequest& request) {
  if (!request.signature || !request.signature->message) {
    return std::nullopt;
  }
  auto nonce = request.signature->message->nonce();
  if (!nonce) {
    return std::nullopt;
  }

  auto ticket = challenges.Lookup(request.owner, *nonce);
  if (ticket) {
    request.challenge = ticket->View();
  }
  return ticket;
}

RegistryEntry FindOrThrow(store::RegistryStore& store, const std::string& url) {
  auto entry = store.FindByUrl(url);
  if (!entry) {
    throw util::EntryNotFound("endpoint not found: " + url);
  }
  return std::move(*entry);
}

void ThrowIfProbeFailed(const probe::ProbeResult& result) {
  if (result.reached()) {
    return;
  }
  const auto error = result.error.value_or("probe failed");
  if (result.outcome == probe::ProbeOutcome::Rejected) {
    throw util::InvalidArgument(error);
  }
  throw util::ProbeFailed("Failed to probe endpoint: " + error);
}

void SortNewestFirst(std::vector<RegistryEntry>& entries) {
  std::sort(entries.begin(), entries.end(), [](const RegistryEntry& a, const RegistryEntry& b) {
    const auto ta = util::FromProto(a.registered_at());
    const auto tb = util::FromProto(b.registered_at());
    if (ta != tb) {
      return ta > tb;
    }
    return a.id() < b.id();
  });
}

} // namespace

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store || !ctx_.challenges || !ctx_.engine || !ctx_.prober) {
    throw std::invalid_argument("RegistryService: incomplete service context");
  }
}

RegisterResponse RegistryService::Register(const RegisterRequest& req) {
  return ObserveRpc("Register", [&]() {
    const auto url = RequireUrl(req.url());
    ValidateName(req.name());
    ValidateDescription(req.description());

    const auto payment = ToPaymentProof(req.payment());
    const auto payer   = PayerAddress(payment, ctx_.settings.network);

    std::string owner;
    if (!req.owner().empty()) {
      owner = RequireOwner(req.owner(), ctx_.settings.network);
    } else if (payer) {
      owner = *payer;
    } else {
      throw util::InvalidArgument("owner is required when the payment names no payer");
    }

    if (auto existing = ctx_.store->FindByUrl(url)) {
      throw util::AlreadyRegistered("endpoint already registered: " + url, existing->id(), existing->owner());
    }

    auth::AuthorizationRequest auth_req;
    auth_req.operation  = auth::Operation::Register;
    auth_req.owner      = owner;
    auth_req.target_url = url;
    ThrowIfDenied(ctx_.engine->Decide(auth_req, util::Now()));

    const auto probe_result = ctx_.prober->Probe(url, ctx_.settings.register_probe_timeout);
    ThrowIfProbeFailed(probe_result);

    store::NewEntry entry;
    entry.url           = url;
    entry.owner         = owner;
    entry.registered_by = payer.value_or("");
    entry.name          = req.name();
    entry.description   = req.description();
    entry.category      = TrimLower(req.category());
    entry.tags          = NormalizeTags(req.tags());
    if (probe_result.is_x402_endpoint) {
      entry.probe_data = probe_result.ToProbeData();
    }

    RegisterResponse resp;
    *resp.mutable_entry() = ctx_.store->Register(entry, util::Now());
    *resp.mutable_probe() = probe_result.ToReport();

    REGISTRY_LOG_INFO("endpoint registered", {observability::StringField("url", url), observability::StringField("owner", owner),
                                              observability::StringField("id", resp.entry().id()),
                                              observability::BoolField("x402", probe_result.is_x402_endpoint)});
    return resp;
  });
}

UpdateResponse RegistryService::Update(const UpdateRequest& req) {
  return ObserveRpc("Update", [&]() {
    const auto url   = RequireUrl(req.url());
    const auto entry = FindOrThrow(*ctx_.store, url);
    CheckClaimedOwner(req.owner(), entry);

    auth::AuthorizationRequest auth_req;
    auth_req.operation  = auth::Operation::Update;
    auth_req.owner      = entry.owner();
    auth_req.target_url = url;
    if (req.has_signature()) {
      auth_req.signature = ToSignatureProof(req.signature());
    }
    if (req.has_payment()) {
      auth_req.payment = ToPaymentProof(req.payment());
    }

    const auto decision = ctx_.engine->Decide(auth_req, util::Now());
    ThrowIfDenied(decision);

    store::EntryPatch patch;
    if (req.has_name()) {
      ValidateName(req.name());
      patch.name = req.name();
    }
    if (req.has_description()) {
      ValidateDescription(req.description());
      patch.description = req.description();
    }
    if (req.has_category()) {
      patch.category = TrimLower(req.category());
    }
    if (req.has_tags()) {
      patch.tags = NormalizeTags(req.tags().values());
    }

    UpdateResponse resp;
    if (req.reprobe()) {
      const auto probe_result = ctx_.prober->Probe(url, ctx_.settings.register_probe_timeout);
      if (probe_result.is_x402_endpoint) {
        patch.probe_data = probe_result.ToProbeData();
      }
      *resp.mutable_probe() = probe_result.ToReport();
    }

    *resp.mutable_entry() = ctx_.store->Update(url, entry.owner(), patch, util::Now());
    resp.mutable_auth()->set_method(std::string(auth::AuthMethodName(decision.method)));

    REGISTRY_LOG_INFO("endpoint updated", {observability::StringField("url", url), observability::StringField("method", auth::AuthMethodName(decision.method))});
    return resp;
  });
}

DeleteResponse RegistryService::Delete(const DeleteRequest& req) {
  return ObserveRpc("Delete", [&]() {
    const auto url = RequireUrl(req.url());

    auth::AuthorizationRequest auth_req;
    auth_req.operation  = auth::Operation::Delete;
    auth_req.target_url = url;
    if (req.has_signature()) {
      auth_req.signature = ToSignatureProof(req.signature());
    }
    if (req.has_payment()) {
      auth_req.payment = ToPaymentProof(req.payment());
    }

    const auto entry = ctx_.store->FindByUrl(url);
    auth_req.owner   = ResolveOwner(entry, req.owner(), auth_req.signature, url, ctx_.settings.network);

    auto ticket = LookupChallenge(*ctx_.challenges, auth_req);
    ThrowIfDenied(ctx_.engine->Decide(auth_req, util::Now()));
    if (!entry) {
      throw util::EntryNotFound("endpoint not found: " + url);
    }
    if (!ticket) {
      throw util::NotAuthorized(std::string(auth::DenyReasonText(auth::DenyReason::ChallengeInvalidOrConsumed)), "no challenge to consume");
    }

    const auto removed = ctx_.store->Delete(url, entry->owner(), *ticket);

    DeleteResponse resp;
    resp.set_id(removed.id());
    resp.set_url(removed.url());
    return resp;
  });
}

TransferResponse RegistryService::Transfer(const TransferRequest& req) {
  return ObserveRpc("Transfer", [&]() {
    const auto url       = RequireUrl(req.url());
    const auto new_owner = RequireOwner(req.new_owner(), ctx_.settings.network, "new_owner");

    auth::AuthorizationRequest auth_req;
    auth_req.operation  = auth::Operation::Transfer;
    auth_req.target_url = url;
    auth_req.new_owner  = new_owner;
    if (req.has_signature()) {
      auth_req.signature = ToSignatureProof(req.signature());
    }
    if (req.has_payment()) {
      auth_req.payment = ToPaymentProof(req.payment());
    }

    const auto entry = ctx_.store->FindByUrl(url);
    auth_req.owner   = ResolveOwner(entry, req.owner(), auth_req.signature, url, ctx_.settings.network);

    if (address::Equivalent(new_owner, auth_req.owner)) {
      throw util::InvalidArgument("new owner is the current owner");
    }

    auto ticket = LookupChallenge(*ctx_.challenges, auth_req);
    ThrowIfDenied(ctx_.engine->Decide(auth_req, util::Now()));
    if (!entry) {
      throw util::EntryNotFound("endpoint not found: " + url);
    }
    if (!ticket) {
      throw util::NotAuthorized(std::string(auth::DenyReasonText(auth::DenyReason::ChallengeInvalidOrConsumed)), "no challenge to consume");
    }

    TransferResponse resp;
    *resp.mutable_entry() = ctx_.store->Transfer(url, entry->owner(), new_owner, *ticket, util::Now());
    resp.set_previous_owner(entry->owner());
    return resp;
  });
}

RequestChallengeResponse RegistryService::RequestChallenge(const RequestChallengeRequest& req) {
  return ObserveRpc("RequestChallenge", [&]() {
    const auto owner = RequireOwner(req.owner(), ctx_.settings.network);
    const auto kind  = auth::ParseActionName(req.action());
    if (!kind) {
      throw util::UnknownAction("unknown action: " + req.action());
    }

    auth::MessageFields fields;
    fields.owner = owner;
    fields.url   = RequireUrl(req.url());
    if (*kind == auth::ActionKind::TransferOwnership) {
      fields.new_owner = RequireOwner(req.new_owner(), ctx_.settings.network, "new_owner");
    }

    const auto now       = util::Now();
    const auto challenge = ctx_.challenges->Issue(owner, *kind, now);
    fields.nonce         = challenge.id();

    const auto message = auth::BuildMessage(*kind, fields, util::ToUnixMillis(now));

    RequestChallengeResponse resp;
    resp.set_challenge_id(challenge.id());
    resp.set_action(challenge.action());
    resp.set_domain_hex(util::ToHex(ctx_.engine->domain().Serialize()));
    resp.set_message_hex(util::ToHex(message.Serialize()));
    resp.set_timestamp(message.timestamp_ms);
    *resp.mutable_expires_at() = challenge.expires_at();
    return resp;
  });
}

MyEndpointsResponse RegistryService::MyEndpoints(const MyEndpointsRequest& req) {
  return ObserveRpc("MyEndpoints", [&]() {
    const auto owner = RequireOwner(req.owner(), ctx_.settings.network);

    auth::AuthorizationRequest auth_req;
    auth_req.operation = auth::Operation::ListMine;
    auth_req.owner     = owner;
    if (req.has_signature()) {
      auth_req.signature = ToSignatureProof(req.signature());
    }
    if (req.has_payment()) {
      auth_req.payment = ToPaymentProof(req.payment());
    }

    const auto decision = ctx_.engine->Decide(auth_req, util::Now());
    ThrowIfDenied(decision);

    auto entries = ctx_.store->ListByOwner(owner);
    SortNewestFirst(entries);

    MyEndpointsResponse resp;
    for (auto& entry : entries) {
      *resp.add_entries() = std::move(entry);
    }
    resp.mutable_auth()->set_method(std::string(auth::AuthMethodName(decision.method)));
    return resp;
  });
}

DetailsResponse RegistryService::Details(const DetailsRequest& req) {
  return ObserveRpc("Details", [&]() {
    std::optional<RegistryEntry> entry;
    switch (req.key_case()) {
      case DetailsRequest::kUrl:
        entry = ctx_.store->FindByUrl(RequireUrl(req.url()));
        break;
      case DetailsRequest::kRef: {
        if (req.ref().id().empty()) {
          throw util::InvalidArgument("id is required");
        }
        const auto owner = RequireOwner(req.ref().owner(), ctx_.settings.network);
        entry            = ctx_.store->FindById(owner, req.ref().id());
        break;
      }
      case DetailsRequest::KEY_NOT_SET:
        throw util::InvalidArgument("url or owner and id are required");
    }
    if (!entry) {
      throw util::EntryNotFound("endpoint not found");
    }

    DetailsResponse resp;
    if (req.live_probe()) {
      *resp.mutable_live() = ctx_.prober->Probe(entry->url()).ToLiveStatus();
    }
    *resp.mutable_entry() = std::move(*entry);
    return resp;
  });
}

ListResponse RegistryService::List(const ListRequest& req) {
  return ObserveRpc("List", [&]() {
    const auto category = TrimLower(req.category());

    auto entries = req.status() == ENTRY_STATUS_UNSPECIFIED ? ctx_.store->ListAll() : ctx_.store->ListByStatus(req.status());
    if (!category.empty()) {
      entries.erase(std::remove_if(entries.begin(), entries.end(), [&](const RegistryEntry& e) { return e.category() != category; }), entries.end());
    }
    SortNewestFirst(entries);

    const uint32_t limit  = req.limit() == 0 ? kDefaultListLimit : std::min(req.limit(), kMaxListLimit);
    const auto     total  = static_cast<uint32_t>(entries.size());
    const uint32_t offset = std::min(req.offset(), total);
    const uint32_t end    = std::min(total, offset + limit);

    ListResponse resp;
    for (uint32_t i = offset; i < end; ++i) {
      *resp.add_entries() = std::move(entries[i]);
    }
    resp.set_total(total);
    resp.set_has_more(end < total);
    return resp;
  });
}

AdminPendingResponse RegistryService::AdminPending(const AdminPendingRequest& req) {
  return ObserveRpc("AdminPending", [&]() {
    RequireAdmin(req.payment());

    auto entries = ctx_.store->ListByStatus(ENTRY_STATUS_UNVERIFIED);
    SortNewestFirst(entries);

    AdminPendingResponse resp;
    for (auto& entry : entries) {
      *resp.add_entries() = std::move(entry);
    }
    return resp;
  });
}

AdminVerifyResponse RegistryService::AdminVerify(const AdminVerifyRequest& req) {
  return ObserveRpc("AdminVerify", [&]() {
    RequireAdmin(req.payment());

    const auto url   = RequireUrl(req.url());
    const auto entry = FindOrThrow(*ctx_.store, url);

    EntryStatus status = ENTRY_STATUS_UNSPECIFIED;
    if (req.action() == "verify") {
      if (!entry.has_probe_data()) {
        throw util::InvalidArgument("only endpoints confirmed by a probe can be verified");
      }
      status = ENTRY_STATUS_VERIFIED;
    } else if (req.action() == "reject") {
      status = ENTRY_STATUS_UNVERIFIED;
    } else {
      throw util::InvalidArgument("action must be verify or reject");
    }

    AdminVerifyResponse resp;
    *resp.mutable_entry() = ctx_.store->SetStatus(url, status, util::Now());

    REGISTRY_LOG_INFO("endpoint status set", {observability::StringField("url", url), observability::StringField("action", req.action())});
    return resp;
  });
}

ProbeResponse RegistryService::Probe(const ProbeRequest& req) {
  return ObserveRpc("Probe", [&]() {
    if (req.url().empty()) {
      throw util::InvalidArgument("url is required");
    }

    ProbeResponse resp;
    *resp.mutable_report() = ctx_.prober->Probe(req.url()).ToReport();
    return resp;
  });
}

void RegistryService::RequireAdmin(const PaymentContext& payment) const {
  const auto admin_denied = std::string(auth::DenyReasonText(auth::DenyReason::AddressMismatch));
  if (ctx_.settings.admin_address.empty()) {
    throw util::NotAuthorized(admin_denied, "no administrator is configured");
  }

  const auto proof = ToPaymentProof(payment);
  if (proof.empty()) {
    throw util::NotAuthorized(std::string(auth::DenyReasonText(auth::DenyReason::NoProofSupplied)), "admin operations require a payment from the administrator");
  }
  if (!auth::PaymentMatches(proof, ctx_.settings.admin_address)) {
    throw util::NotAuthorized(admin_denied, "payment did not originate from the administrator");
  }
}

} // namespace x402::service
