#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/address/address.hpp"

namespace x402::auth {

/*
  Settlement outcome reported by the payment facilitator after a call is funded.

  Facilitators disagree on field names; FromJson folds sender/senderAddress/sender_address/payer
  into payer_address (and the recipient variants into recipient_address) so nothing past this
  boundary sees the raw shapes.
*/
struct SettlementOutcome {
  bool                       success{false};
  std::optional<std::string> payer_address;
  std::optional<std::string> recipient_address;
  std::optional<std::string> tx_id;

  // nullopt when the payload is not a JSON object.
  static std::optional<SettlementOutcome> FromJson(std::string_view json);
};

// Whatever the payment collaborator surfaced for the current call.
struct PaymentProof {
  std::optional<SettlementOutcome>    settlement;
  std::optional<std::vector<uint8_t>> signed_transaction;

  static PaymentProof FromSettlement(SettlementOutcome outcome);

  // Accepts an optional "0x" prefix; undecodable hex leaves the proof empty.
  static PaymentProof FromSignedTransactionHex(std::string_view hex);

  bool empty() const {
    return !settlement && !signed_transaction;
  }
};

// Origin signer of a serialized transaction:
// version(1) chain-id(4) auth-type(1) hash-mode(1) signer(20) ...
std::optional<address::Fingerprint> SignerFingerprint(const std::vector<uint8_t>& signed_transaction);

// Settlement payer first, then the signed transaction. nullopt means "no proof available".
std::optional<address::Fingerprint> PayerFingerprint(const PaymentProof& proof);

bool PaymentMatches(const PaymentProof& proof, std::string_view expected_address);

} // namespace x402::auth
