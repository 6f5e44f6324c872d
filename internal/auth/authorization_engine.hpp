#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "internal/auth/payment_origin.hpp"
#include "internal/auth/replay_window.hpp"
#include "internal/auth/signature_verifier.hpp"
#include "internal/auth/structured_message.hpp"
#include "internal/util/time.hpp"

namespace x402::auth {

enum class Operation { Register, Update, Delete, Transfer, ListMine };

enum class DenyReason {
  NoProofSupplied,
  SignatureInvalid,
  AddressMismatch,
  TimestampExpired,
  ChallengeInvalidOrConsumed,
};

enum class AuthMethod { None, Signature, Payment };

std::string_view OperationName(Operation operation);
std::string_view DenyReasonText(DenyReason reason);
std::string_view AuthMethodName(AuthMethod method);

enum class SignatureMode { Structured, Simple };

struct SignatureProof {
  SignatureMode                    mode{SignatureMode::Structured};
  std::string                      signature;
  std::string                      expected_address;
  std::optional<StructuredMessage> message;     // structured mode
  std::string                      raw_message; // simple mode
};

// Server-side view of an issued challenge, as read from storage.
struct ChallengeView {
  std::string     id;
  std::string     owner;
  ActionKind      action{ActionKind::ChallengeResponse};
  util::TimePoint expires_at;
};

struct AuthorizationRequest {
  Operation                     operation{Operation::Register};
  std::string                   owner; // the entry owner being acted as
  std::optional<std::string>    target_url;
  std::optional<std::string>    new_owner;
  std::optional<SignatureProof> signature;
  std::optional<PaymentProof>   payment;
  std::optional<ChallengeView>  challenge; // nullopt: never issued, expired and purged, or consumed
};

struct AuthorizationDecision {
  bool                      authorized{false};
  AuthMethod                method{AuthMethod::None};
  std::optional<DenyReason> reason;
  std::string               detail;

  static AuthorizationDecision Allow(AuthMethod method) {
    AuthorizationDecision d;
    d.authorized = true;
    d.method     = method;
    return d;
  }

  static AuthorizationDecision Deny(DenyReason reason, std::string detail) {
    AuthorizationDecision d;
    d.reason = reason;
    d.detail = std::move(detail);
    return d;
  }

  explicit operator bool() const {
    return authorized;
  }
};

/*
  Pure decision over the proofs a request carries; performs no I/O and no mutation.

  register          always allowed (uniqueness is the store's concern)
  update, list-mine signature OR payment origin resolving to the owner
  delete, transfer  structured signature + fresh timestamp + live challenge for owner/action
*/
class AuthorizationEngine {
 public:
  AuthorizationEngine(address::Network network, Domain domain, ReplayWindow window);

  AuthorizationDecision Decide(const AuthorizationRequest& request, util::TimePoint now) const;

  const Domain& domain() const {
    return domain_;
  }
  const ReplayWindow& window() const {
    return window_;
  }

 private:
  AuthorizationDecision DecideDualPath(const AuthorizationRequest& request, util::TimePoint now) const;
  AuthorizationDecision DecideDestructive(const AuthorizationRequest& request, util::TimePoint now) const;

  // Checks a signature proof against the owner; nullopt on success.
  std::optional<AuthorizationDecision> CheckSignature(const AuthorizationRequest& request, const SignatureProof& proof, ActionKind expected_action,
                                                      util::TimePoint now) const;

  SignatureVerifier verifier_;
  Domain            domain_;
  ReplayWindow      window_;
};

} // namespace x402::auth
