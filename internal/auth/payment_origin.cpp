#include "payment_origin.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <initializer_list>
#include <utility>

#include "internal/util/hex.hpp"

namespace x402::auth {
namespace {

constexpr std::size_t kSignerOffset = 7;

constexpr uint8_t kAuthStandard  = 0x04;
constexpr uint8_t kAuthSponsored = 0x05;

bool IsKnownHashMode(uint8_t mode) {
  switch (mode) {
    case 0x00: // p2pkh
    case 0x01: // p2sh
    case 0x02: // p2wpkh-p2sh
    case 0x03: // p2wsh-p2sh
    case 0x05: // non-sequential p2sh
    case 0x07: // non-sequential p2wsh-p2sh
      return true;
    default:
      return false;
  }
}

std::optional<std::string> FirstString(const google::protobuf::Struct& object, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = object.fields().find(key);
    if (it == object.fields().end()) {
      continue;
    }
    if (it->second.kind_case() == google::protobuf::Value::kStringValue && !it->second.string_value().empty()) {
      return it->second.string_value();
    }
  }
  return std::nullopt;
}

} // namespace

std::optional<SettlementOutcome> SettlementOutcome::FromJson(std::string_view json) {
  google::protobuf::Struct object;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &object, options);
  if (!status.ok()) {
    return std::nullopt;
  }

  SettlementOutcome outcome;
  outcome.payer_address     = FirstString(object, {"senderAddress", "sender_address", "sender", "payer"});
  outcome.recipient_address = FirstString(object, {"recipientAddress", "recipient_address", "recipient"});
  outcome.tx_id             = FirstString(object, {"txId", "tx_id", "transaction"});

  for (const char* key : {"success", "isValid"}) {
    auto it = object.fields().find(key);
    if (it != object.fields().end() && it->second.kind_case() == google::protobuf::Value::kBoolValue) {
      outcome.success = it->second.bool_value();
      break;
    }
  }
  return outcome;
}

PaymentProof PaymentProof::FromSettlement(SettlementOutcome outcome) {
  PaymentProof proof;
  proof.settlement = std::move(outcome);
  return proof;
}

PaymentProof PaymentProof::FromSignedTransactionHex(std::string_view hex) {
  PaymentProof proof;
  if (auto bytes = util::FromHex(hex); bytes && !bytes->empty()) {
    proof.signed_transaction = std::move(*bytes);
  }
  return proof;
}

std::optional<address::Fingerprint> SignerFingerprint(const std::vector<uint8_t>& tx) {
  address::Fingerprint signer{};
  if (tx.size() < kSignerOffset + signer.size()) {
    return std::nullopt;
  }

  const uint8_t version   = tx[0];
  const uint8_t auth_type = tx[5];
  const uint8_t hash_mode = tx[6];
  if ((version != 0x00 && version != 0x80) || (auth_type != kAuthStandard && auth_type != kAuthSponsored) || !IsKnownHashMode(hash_mode)) {
    return std::nullopt;
  }

  std::copy(tx.begin() + kSignerOffset, tx.begin() + kSignerOffset + signer.size(), signer.begin());
  return signer;
}

std::optional<address::Fingerprint> PayerFingerprint(const PaymentProof& proof) {
  if (proof.settlement && proof.settlement->payer_address) {
    if (auto payer = address::Address::TryParse(*proof.settlement->payer_address)) {
      return payer->fingerprint();
    }
  }
  if (proof.signed_transaction) {
    return SignerFingerprint(*proof.signed_transaction);
  }
  return std::nullopt;
}

bool PaymentMatches(const PaymentProof& proof, std::string_view expected_address) {
  const auto expected = address::Address::TryParse(expected_address);
  const auto payer    = PayerFingerprint(proof);
  return expected && payer && expected->fingerprint() == *payer;
}

} // namespace x402::auth
