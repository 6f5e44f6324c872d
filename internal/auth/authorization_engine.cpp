#include "authorization_engine.hpp"

#include "internal/address/address.hpp"
#include "internal/util/url.hpp"

namespace x402::auth {
namespace {

DenyReason ReasonFor(VerifyFailure failure) {
  switch (failure) {
    case VerifyFailure::AddressMismatch:
    case VerifyFailure::InvalidExpectedAddress:
      return DenyReason::AddressMismatch;
    case VerifyFailure::None:
    case VerifyFailure::MalformedSignature:
    case VerifyFailure::RecoveryFailed:
      break;
  }
  return DenyReason::SignatureInvalid;
}

bool SameUrl(const std::optional<std::string>& signed_url, const std::optional<std::string>& target_url) {
  if (!target_url) {
    return true;
  }
  if (!signed_url) {
    return false;
  }
  const auto normalized = util::NormalizeUrl(*signed_url);
  return normalized && *normalized == *target_url;
}

} // namespace

std::string_view OperationName(Operation operation) {
  switch (operation) {
    case Operation::Register:
      return "register";
    case Operation::Update:
      return "update";
    case Operation::Delete:
      return "delete";
    case Operation::Transfer:
      return "transfer";
    case Operation::ListMine:
      return "list-mine";
  }
  return "unknown";
}

std::string_view DenyReasonText(DenyReason reason) {
  switch (reason) {
    case DenyReason::NoProofSupplied:
      return "no proof supplied";
    case DenyReason::SignatureInvalid:
      return "signature invalid";
    case DenyReason::AddressMismatch:
      return "address mismatch";
    case DenyReason::TimestampExpired:
      return "timestamp expired";
    case DenyReason::ChallengeInvalidOrConsumed:
      return "challenge invalid or consumed";
  }
  return "unknown";
}

std::string_view AuthMethodName(AuthMethod method) {
  switch (method) {
    case AuthMethod::None:
      return "none";
    case AuthMethod::Signature:
      return "signature";
    case AuthMethod::Payment:
      return "payment";
  }
  return "unknown";
}

AuthorizationEngine::AuthorizationEngine(address::Network network, Domain domain, ReplayWindow window)
    : verifier_(network), domain_(std::move(domain)), window_(window) {
}

AuthorizationDecision AuthorizationEngine::Decide(const AuthorizationRequest& request, util::TimePoint now) const {
  switch (request.operation) {
    case Operation::Register:
      return AuthorizationDecision::Allow(AuthMethod::None);
    case Operation::Update:
    case Operation::ListMine:
      return DecideDualPath(request, now);
    case Operation::Delete:
    case Operation::Transfer:
      return DecideDestructive(request, now);
  }
  return AuthorizationDecision::Deny(DenyReason::NoProofSupplied, "unsupported operation");
}

std::optional<AuthorizationDecision> AuthorizationEngine::CheckSignature(const AuthorizationRequest& request, const SignatureProof& proof,
                                                                         ActionKind expected_action, util::TimePoint now) const {
  if (!address::Equivalent(proof.expected_address, request.owner)) {
    return AuthorizationDecision::Deny(DenyReason::AddressMismatch, "signer address is not the entry owner");
  }

  if (proof.mode == SignatureMode::Simple) {
    auto result = verifier_.VerifySimple(proof.raw_message, proof.signature, request.owner);
    if (!result) {
      return AuthorizationDecision::Deny(ReasonFor(result.failure), result.error);
    }
    return std::nullopt;
  }

  if (!proof.message) {
    return AuthorizationDecision::Deny(DenyReason::SignatureInvalid, "structured signature without a message");
  }

  const auto& message = *proof.message;
  if (message.kind() != expected_action) {
    return AuthorizationDecision::Deny(DenyReason::SignatureInvalid,
                                       "message action '" + std::string(ActionName(message.kind())) + "' does not authorize " +
                                           std::string(OperationName(request.operation)));
  }
  if (!address::Equivalent(message.owner, request.owner)) {
    return AuthorizationDecision::Deny(DenyReason::AddressMismatch, "message owner is not the entry owner");
  }
  if (!SameUrl(message.url(), request.target_url)) {
    return AuthorizationDecision::Deny(DenyReason::SignatureInvalid, "message url does not match the entry");
  }
  if (request.operation == Operation::Transfer) {
    const auto* transfer = std::get_if<action::TransferOwnership>(&message.action);
    if (transfer == nullptr || !request.new_owner || !address::Equivalent(transfer->new_owner, *request.new_owner)) {
      return AuthorizationDecision::Deny(DenyReason::SignatureInvalid, "message new-owner does not match the request");
    }
  }

  auto result = verifier_.VerifyStructured(message, domain_, proof.signature, request.owner);
  if (!result) {
    return AuthorizationDecision::Deny(ReasonFor(result.failure), result.error);
  }

  if (!window_.IsFresh(message.timestamp_ms, now)) {
    return AuthorizationDecision::Deny(DenyReason::TimestampExpired, "signed timestamp is outside the replay window");
  }
  return std::nullopt;
}

AuthorizationDecision AuthorizationEngine::DecideDualPath(const AuthorizationRequest& request, util::TimePoint now) const {
  const auto expected_action = request.operation == Operation::Update ? ActionKind::UpdateEndpoint : ActionKind::ListMyEndpoints;

  std::optional<AuthorizationDecision> signature_denial;
  if (request.signature) {
    signature_denial = CheckSignature(request, *request.signature, expected_action, now);
    if (!signature_denial) {
      return AuthorizationDecision::Allow(AuthMethod::Signature);
    }
  }

  std::optional<AuthorizationDecision> payment_denial;
  if (request.payment && !request.payment->empty()) {
    if (PaymentMatches(*request.payment, request.owner)) {
      return AuthorizationDecision::Allow(AuthMethod::Payment);
    }
    if (PayerFingerprint(*request.payment)) {
      payment_denial = AuthorizationDecision::Deny(DenyReason::AddressMismatch, "payment did not originate from the entry owner");
    } else {
      payment_denial = AuthorizationDecision::Deny(DenyReason::NoProofSupplied, "payment carried no identifiable payer");
    }
  }

  if (signature_denial) {
    return *signature_denial;
  }
  if (payment_denial) {
    return *payment_denial;
  }
  return AuthorizationDecision::Deny(DenyReason::NoProofSupplied, "a signature or a payment from the owner is required");
}

AuthorizationDecision AuthorizationEngine::DecideDestructive(const AuthorizationRequest& request, util::TimePoint now) const {
  if (!request.signature) {
    return AuthorizationDecision::Deny(DenyReason::NoProofSupplied, std::string(OperationName(request.operation)) +
                                                                        " requires a structured signature; payment origin is not sufficient");
  }

  const auto& proof = *request.signature;
  if (proof.mode != SignatureMode::Structured) {
    return AuthorizationDecision::Deny(DenyReason::SignatureInvalid, "simple signatures cannot authorize " + std::string(OperationName(request.operation)));
  }

  const auto expected_action = request.operation == Operation::Delete ? ActionKind::DeleteEndpoint : ActionKind::TransferOwnership;
  if (auto denial = CheckSignature(request, proof, expected_action, now)) {
    return *denial;
  }

  const auto nonce = proof.message->nonce();
  if (!nonce) {
    return AuthorizationDecision::Deny(DenyReason::ChallengeInvalidOrConsumed, "signed message does not embed a challenge");
  }
  if (!request.challenge || request.challenge->id != *nonce) {
    return AuthorizationDecision::Deny(DenyReason::ChallengeInvalidOrConsumed, "challenge was never issued or is already consumed");
  }

  const auto& challenge = *request.challenge;
  if (now >= challenge.expires_at) {
    return AuthorizationDecision::Deny(DenyReason::ChallengeInvalidOrConsumed, "challenge expired");
  }
  if (!address::Equivalent(challenge.owner, request.owner)) {
    return AuthorizationDecision::Deny(DenyReason::ChallengeInvalidOrConsumed, "challenge was issued to a different owner");
  }
  if (challenge.action != expected_action) {
    return AuthorizationDecision::Deny(DenyReason::ChallengeInvalidOrConsumed, "challenge was issued for a different action");
  }

  return AuthorizationDecision::Allow(AuthMethod::Signature);
}

} // namespace x402::auth
