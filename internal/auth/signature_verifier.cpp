#include "signature_verifier.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "internal/crypto/secp256k1.hpp"
#include "internal/util/hex.hpp"

namespace x402::auth {
namespace {

VerificationResult Fail(VerifyFailure failure, std::string error) {
  VerificationResult result;
  result.failure = failure;
  result.error   = std::move(error);
  return result;
}

} // namespace

std::string_view VerifyFailureName(VerifyFailure failure) {
  switch (failure) {
    case VerifyFailure::None:
      return "none";
    case VerifyFailure::MalformedSignature:
      return "malformed signature";
    case VerifyFailure::RecoveryFailed:
      return "recovery failed";
    case VerifyFailure::InvalidExpectedAddress:
      return "invalid expected address";
    case VerifyFailure::AddressMismatch:
      return "address mismatch";
  }
  return "unknown";
}

VerificationResult SignatureVerifier::VerifyStructured(const StructuredMessage& message, const Domain& domain, std::string_view signature,
                                                       std::string_view expected_address) const {
  std::vector<uint8_t> message_bytes;
  std::vector<uint8_t> domain_bytes;
  try {
    message_bytes = message.Serialize();
    domain_bytes  = domain.Serialize();
  } catch (const std::exception& e) {
    return Fail(VerifyFailure::MalformedSignature, std::string("message not encodable: ") + e.what());
  }
  return VerifyStructured(message_bytes, domain_bytes, signature, expected_address);
}

VerificationResult SignatureVerifier::VerifyStructured(const std::vector<uint8_t>& message, const std::vector<uint8_t>& domain,
                                                       std::string_view signature, std::string_view expected_address) const {
  return VerifyDigest(StructuredDataHash(domain, message), signature, expected_address);
}

VerificationResult SignatureVerifier::VerifySimple(std::string_view message, std::string_view signature, std::string_view expected_address) const {
  return VerifyDigest(crypto::Sha256(message), signature, expected_address);
}

VerificationResult SignatureVerifier::VerifyDigest(const crypto::Sha256Digest& digest, std::string_view signature,
                                                   std::string_view expected_address) const {
  auto bytes = util::FromHex(signature);
  if (!bytes || bytes->size() != crypto::kRecoverableSignatureSize) {
    return Fail(VerifyFailure::MalformedSignature, "signature must be 65 hex-encoded bytes");
  }

  crypto::RecoverableSignature rsv{};
  std::copy(bytes->begin(), bytes->end(), rsv.begin());

  std::optional<crypto::PublicKey> public_key;
  try {
    public_key = crypto::RecoverPublicKey(digest, rsv);
  } catch (const std::exception& e) {
    return Fail(VerifyFailure::RecoveryFailed, std::string("public key recovery failed: ") + e.what());
  }
  if (!public_key) {
    return Fail(VerifyFailure::RecoveryFailed, "public key recovery failed");
  }

  const auto recovered = address::Address::FromPublicKey(*public_key, address::SingleSigVersion(network_));

  VerificationResult result;
  result.recovered_address = recovered.ToString();

  const auto expected = address::Address::TryParse(expected_address);
  if (!expected) {
    result.failure = VerifyFailure::InvalidExpectedAddress;
    result.error   = "expected address is not a valid address";
    return result;
  }

  if (!recovered.SameIdentity(*expected)) {
    result.failure = VerifyFailure::AddressMismatch;
    result.error   = "recovered address does not match expected address";
    return result;
  }

  result.valid = true;
  return result;
}

} // namespace x402::auth
