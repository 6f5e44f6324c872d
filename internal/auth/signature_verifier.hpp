#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/address/address.hpp"
#include "internal/auth/structured_message.hpp"

namespace x402::auth {

enum class VerifyFailure {
  None,
  MalformedSignature,
  RecoveryFailed,
  InvalidExpectedAddress,
  AddressMismatch,
};

struct VerificationResult {
  bool                       valid{false};
  VerifyFailure              failure{VerifyFailure::None};
  std::optional<std::string> recovered_address;
  std::string                error;

  explicit operator bool() const {
    return valid;
  }
};

/*
  Recovers the signer of a 65-byte RSV signature and compares it with the expected address
  by fingerprint. Nothing here throws on bad input; every failure is a VerificationResult.

  recovered_address is reported with the single-sig version of the configured network.
*/
class SignatureVerifier {
 public:
  explicit SignatureVerifier(address::Network network) : network_(network) {
  }

  // Domain-separated: the domain tuple is part of the signed hash.
  VerificationResult VerifyStructured(const StructuredMessage& message, const Domain& domain, std::string_view signature,
                                      std::string_view expected_address) const;

  // Same, over already-serialized Clarity values.
  VerificationResult VerifyStructured(const std::vector<uint8_t>& message, const std::vector<uint8_t>& domain, std::string_view signature,
                                      std::string_view expected_address) const;

  // sha256 of the raw message bytes; no domain, no schema.
  VerificationResult VerifySimple(std::string_view message, std::string_view signature, std::string_view expected_address) const;

  address::Network network() const {
    return network_;
  }

 private:
  VerificationResult VerifyDigest(const crypto::Sha256Digest& digest, std::string_view signature, std::string_view expected_address) const;

  address::Network network_;
};

std::string_view VerifyFailureName(VerifyFailure failure);

} // namespace x402::auth
