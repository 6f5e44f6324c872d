#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/address/address.hpp"
#include "internal/crypto/hash.hpp"

namespace x402::auth {

/*
  Action-typed messages signed by entry owners.

  Each alternative carries exactly the fields its action signs over. Serialization is a
  Clarity tuple, so the same inputs always yield the same bytes.
*/

enum class ActionKind {
  DeleteEndpoint,
  ListMyEndpoints,
  TransferOwnership,
  ChallengeResponse,
  UpdateEndpoint,
};

std::string_view          ActionName(ActionKind kind);
std::optional<ActionKind> ParseActionName(std::string_view name);

namespace action {

struct DeleteEndpoint {
  std::string                url;
  std::optional<std::string> nonce;
};

struct ListMyEndpoints {};

struct TransferOwnership {
  std::string                url;
  std::string                new_owner;
  std::optional<std::string> nonce;
};

struct ChallengeResponse {
  std::string nonce;
};

struct UpdateEndpoint {
  std::string url;
};

} // namespace action

using Action = std::variant<action::DeleteEndpoint, action::ListMyEndpoints, action::TransferOwnership, action::ChallengeResponse, action::UpdateEndpoint>;

// Loose inputs as they arrive from a request.
struct MessageFields {
  std::string                owner;
  std::optional<std::string> url;
  std::optional<std::string> new_owner;
  std::optional<std::string> nonce;
};

struct StructuredMessage {
  Action      action;
  std::string owner;
  uint64_t    timestamp_ms{0};

  ActionKind kind() const;

  // Embedded challenge nonce, if this action carries one.
  std::optional<std::string> nonce() const;

  // Target URL, if this action carries one.
  std::optional<std::string> url() const;

  std::vector<uint8_t> Serialize() const;
};

// Throws util::UnknownAction when a field required by the action is missing.
StructuredMessage BuildMessage(ActionKind kind, const MessageFields& fields, uint64_t timestamp_ms);

// Throws util::UnknownAction for names outside the closed action set.
StructuredMessage BuildMessage(std::string_view action_name, const MessageFields& fields, uint64_t timestamp_ms);

inline constexpr uint64_t kMainnetChainId = 1;
inline constexpr uint64_t kTestnetChainId = 2147483648ULL;

struct Domain {
  std::string name{"stx402-registry"};
  std::string version{"1.0.0"};
  uint64_t    chain_id{kMainnetChainId};

  static Domain ForNetwork(address::Network network, std::string name = "stx402-registry", std::string version = "1.0.0");

  std::vector<uint8_t> Serialize() const;
};

// sha256("SIP018" ++ sha256(domain) ++ sha256(message))
crypto::Sha256Digest StructuredDataHash(const std::vector<uint8_t>& domain, const std::vector<uint8_t>& message);

crypto::Sha256Digest StructuredDataHash(const Domain& domain, const StructuredMessage& message);

} // namespace x402::auth
