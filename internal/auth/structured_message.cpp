#include "structured_message.hpp"

#include <array>
#include <utility>

#include "internal/auth/clarity.hpp"
#include "internal/util/errors.hpp"

namespace x402::auth {
namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

constexpr std::array<uint8_t, 6> kStructuredDataPrefix = {'S', 'I', 'P', '0', '1', '8'};

const std::string& Require(const std::optional<std::string>& value, ActionKind kind, std::string_view field) {
  if (!value || value->empty()) {
    throw util::UnknownAction(std::string(ActionName(kind)) + " requires '" + std::string(field) + "'");
  }
  return *value;
}

} // namespace

std::string_view ActionName(ActionKind kind) {
  switch (kind) {
    case ActionKind::DeleteEndpoint:
      return "delete-endpoint";
    case ActionKind::ListMyEndpoints:
      return "list-my-endpoints";
    case ActionKind::TransferOwnership:
      return "transfer-ownership";
    case ActionKind::ChallengeResponse:
      return "challenge-response";
    case ActionKind::UpdateEndpoint:
      return "update-endpoint";
  }
  return "unknown";
}

std::optional<ActionKind> ParseActionName(std::string_view name) {
  for (auto kind : {ActionKind::DeleteEndpoint, ActionKind::ListMyEndpoints, ActionKind::TransferOwnership, ActionKind::ChallengeResponse,
                    ActionKind::UpdateEndpoint}) {
    if (ActionName(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

ActionKind StructuredMessage::kind() const {
  return std::visit(Overloaded{
                        [](const action::DeleteEndpoint&) { return ActionKind::DeleteEndpoint; },
                        [](const action::ListMyEndpoints&) { return ActionKind::ListMyEndpoints; },
                        [](const action::TransferOwnership&) { return ActionKind::TransferOwnership; },
                        [](const action::ChallengeResponse&) { return ActionKind::ChallengeResponse; },
                        [](const action::UpdateEndpoint&) { return ActionKind::UpdateEndpoint; },
                    },
                    action);
}

std::optional<std::string> StructuredMessage::nonce() const {
  return std::visit(Overloaded{
                        [](const action::DeleteEndpoint& a) { return a.nonce; },
                        [](const action::ListMyEndpoints&) { return std::optional<std::string>{}; },
                        [](const action::TransferOwnership& a) { return a.nonce; },
                        [](const action::ChallengeResponse& a) { return std::optional<std::string>{a.nonce}; },
                        [](const action::UpdateEndpoint&) { return std::optional<std::string>{}; },
                    },
                    action);
}

std::optional<std::string> StructuredMessage::url() const {
  return std::visit(Overloaded{
                        [](const action::DeleteEndpoint& a) { return std::optional<std::string>{a.url}; },
                        [](const action::ListMyEndpoints&) { return std::optional<std::string>{}; },
                        [](const action::TransferOwnership& a) { return std::optional<std::string>{a.url}; },
                        [](const action::ChallengeResponse&) { return std::optional<std::string>{}; },
                        [](const action::UpdateEndpoint& a) { return std::optional<std::string>{a.url}; },
                    },
                    action);
}

std::vector<uint8_t> StructuredMessage::Serialize() const {
  clarity::Tuple tuple;
  tuple.AddString("action", ActionName(kind()));
  tuple.AddString("owner", owner);
  tuple.AddUInt("timestamp", timestamp_ms);

  std::visit(Overloaded{
                 [&](const action::DeleteEndpoint& a) {
                   tuple.AddString("url", a.url);
                   if (a.nonce) tuple.AddString("nonce", *a.nonce);
                 },
                 [](const action::ListMyEndpoints&) {},
                 [&](const action::TransferOwnership& a) {
                   tuple.AddString("url", a.url);
                   tuple.AddString("new-owner", a.new_owner);
                   if (a.nonce) tuple.AddString("nonce", *a.nonce);
                 },
                 [&](const action::ChallengeResponse& a) { tuple.AddString("nonce", a.nonce); },
                 [&](const action::UpdateEndpoint& a) { tuple.AddString("url", a.url); },
             },
             action);

  return tuple.Serialize();
}

StructuredMessage BuildMessage(ActionKind kind, const MessageFields& fields, uint64_t timestamp_ms) {
  if (fields.owner.empty()) {
    throw util::UnknownAction(std::string(ActionName(kind)) + " requires 'owner'");
  }

  StructuredMessage message;
  message.owner        = fields.owner;
  message.timestamp_ms = timestamp_ms;

  switch (kind) {
    case ActionKind::DeleteEndpoint:
      message.action = action::DeleteEndpoint{Require(fields.url, kind, "url"), fields.nonce};
      break;
    case ActionKind::ListMyEndpoints:
      message.action = action::ListMyEndpoints{};
      break;
    case ActionKind::TransferOwnership:
      message.action = action::TransferOwnership{Require(fields.url, kind, "url"), Require(fields.new_owner, kind, "new-owner"), fields.nonce};
      break;
    case ActionKind::ChallengeResponse:
      message.action = action::ChallengeResponse{Require(fields.nonce, kind, "nonce")};
      break;
    case ActionKind::UpdateEndpoint:
      message.action = action::UpdateEndpoint{Require(fields.url, kind, "url")};
      break;
  }
  return message;
}

StructuredMessage BuildMessage(std::string_view action_name, const MessageFields& fields, uint64_t timestamp_ms) {
  auto kind = ParseActionName(action_name);
  if (!kind) {
    throw util::UnknownAction("unknown action: '" + std::string(action_name) + "'");
  }
  return BuildMessage(*kind, fields, timestamp_ms);
}

Domain Domain::ForNetwork(address::Network network, std::string name, std::string version) {
  Domain domain;
  domain.name     = std::move(name);
  domain.version  = std::move(version);
  domain.chain_id = network == address::Network::Mainnet ? kMainnetChainId : kTestnetChainId;
  return domain;
}

std::vector<uint8_t> Domain::Serialize() const {
  return clarity::Tuple{}.AddString("name", name).AddString("version", version).AddUInt("chain-id", chain_id).Serialize();
}

crypto::Sha256Digest StructuredDataHash(const std::vector<uint8_t>& domain, const std::vector<uint8_t>& message) {
  const auto domain_hash  = crypto::Sha256(domain);
  const auto message_hash = crypto::Sha256(message);

  std::vector<uint8_t> preimage(kStructuredDataPrefix.begin(), kStructuredDataPrefix.end());
  preimage.insert(preimage.end(), domain_hash.begin(), domain_hash.end());
  preimage.insert(preimage.end(), message_hash.begin(), message_hash.end());
  return crypto::Sha256(preimage);
}

crypto::Sha256Digest StructuredDataHash(const Domain& domain, const StructuredMessage& message) {
  return StructuredDataHash(domain.Serialize(), message.Serialize());
}

} // namespace x402::auth
