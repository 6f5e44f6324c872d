#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/address/address.hpp"
#include "internal/auth/signature_verifier.hpp"
#include "internal/auth/structured_message.hpp"
#include "internal/crypto/secp256k1.hpp"
#include "internal/util/hex.hpp"

namespace {

using namespace x402::auth;
using x402::address::Address;
using x402::address::Network;

struct Signer {
  x402::crypto::PrivateKey key;
  std::string              mainnet;
  std::string              testnet;
};

Signer NewSigner() {
  Signer s;
  s.key         = x402::crypto::GeneratePrivateKey();
  const auto pk = x402::crypto::DerivePublicKey(s.key);
  s.mainnet     = Address::FromPublicKey(pk, x402::address::version::kMainnetSingleSig).ToString();
  s.testnet     = Address::FromPublicKey(pk, x402::address::version::kTestnetSingleSig).ToString();
  return s;
}

std::string SignStructured(const Signer& signer, const Domain& domain, const StructuredMessage& message) {
  const auto sig = x402::crypto::SignRecoverable(StructuredDataHash(domain, message), signer.key);
  return x402::util::ToHex(sig.data(), sig.size());
}

std::string SignSimple(const Signer& signer, const std::string& message) {
  const auto sig = x402::crypto::SignRecoverable(x402::crypto::Sha256(std::string_view(message)), signer.key);
  return x402::util::ToHex(sig.data(), sig.size());
}

StructuredMessage DeleteMessage(const std::string& owner, uint64_t ts) {
  MessageFields fields;
  fields.owner = owner;
  fields.url   = "https://api.example.com/x";
  fields.nonce = "3f1c8f0e-2a55-4d55-9b7e-6a1d9c0f1e22";
  return BuildMessage(ActionKind::DeleteEndpoint, fields, ts);
}

void TestStructuredSignatureVerifies() {
  const auto              signer = NewSigner();
  const SignatureVerifier verifier(Network::Mainnet);
  const auto              domain  = Domain::ForNetwork(Network::Mainnet);
  const auto              message = DeleteMessage(signer.mainnet, 1700000000000);
  const auto              sig     = SignStructured(signer, domain, message);

  const auto result = verifier.VerifyStructured(message, domain, sig, signer.mainnet);
  assert(result.valid);
  assert(result.failure == VerifyFailure::None);
  assert(result.recovered_address == signer.mainnet);

  // 0x prefix and the serialized-bytes overload
  const auto raw = verifier.VerifyStructured(message.Serialize(), domain.Serialize(), "0x" + sig, signer.mainnet);
  assert(raw.valid);
}

void TestStructuredSignatureIsDomainSeparated() {
  const auto              signer = NewSigner();
  const SignatureVerifier verifier(Network::Mainnet);
  const auto              d1      = Domain::ForNetwork(Network::Mainnet);
  const auto              d2      = Domain::ForNetwork(Network::Mainnet, "stx402-registry", "2.0.0");
  const auto              testnet = Domain::ForNetwork(Network::Testnet);
  const auto              message = DeleteMessage(signer.mainnet, 1700000000000);
  const auto              sig     = SignStructured(signer, d1, message);

  assert(!verifier.VerifyStructured(message, d2, sig, signer.mainnet).valid);
  assert(!verifier.VerifyStructured(message, testnet, sig, signer.mainnet).valid);
}

void TestTamperedMessageOrSignatureFails() {
  const auto              signer = NewSigner();
  const SignatureVerifier verifier(Network::Mainnet);
  const auto              domain  = Domain::ForNetwork(Network::Mainnet);
  const auto              message = DeleteMessage(signer.mainnet, 1700000000000);
  const auto              sig     = SignStructured(signer, domain, message);

  // one bit of the timestamp
  assert(!verifier.VerifyStructured(DeleteMessage(signer.mainnet, 1700000000001), domain, sig, signer.mainnet).valid);

  // one bit of the serialized message
  auto bytes = message.Serialize();
  bytes.back() ^= 0x01;
  assert(!verifier.VerifyStructured(bytes, domain.Serialize(), sig, signer.mainnet).valid);

  // every bit of the signature
  const auto sig_bytes = *x402::util::FromHex(sig);
  for (std::size_t i = 0; i < sig_bytes.size(); ++i) {
    for (int bit = 0; bit < 8; ++bit) {
      auto tampered = sig_bytes;
      tampered[i] ^= static_cast<uint8_t>(1u << bit);
      const auto result = verifier.VerifyStructured(message, domain, x402::util::ToHex(tampered), signer.mainnet);
      assert(!result.valid);
    }
  }
}

void TestWrongSignerIsAddressMismatch() {
  const auto              signer = NewSigner();
  const auto              other  = NewSigner();
  const SignatureVerifier verifier(Network::Mainnet);
  const auto              domain  = Domain::ForNetwork(Network::Mainnet);
  const auto              message = DeleteMessage(other.mainnet, 1700000000000);
  const auto              sig     = SignStructured(signer, domain, message);

  const auto result = verifier.VerifyStructured(message, domain, sig, other.mainnet);
  assert(!result.valid);
  assert(result.failure == VerifyFailure::AddressMismatch);
  assert(result.recovered_address == signer.mainnet);
}

void TestMalformedInputsNeverThrow() {
  const auto              signer = NewSigner();
  const SignatureVerifier verifier(Network::Mainnet);

  auto result = verifier.VerifySimple("hello", "abcd", signer.mainnet);
  assert(result.failure == VerifyFailure::MalformedSignature);
  assert(!result.error.empty());

  result = verifier.VerifySimple("hello", std::string(130, 'z'), signer.mainnet);
  assert(result.failure == VerifyFailure::MalformedSignature);

  result = verifier.VerifySimple("hello", std::string(130, '0'), signer.mainnet);
  assert(result.failure == VerifyFailure::RecoveryFailed);

  const auto sig = SignSimple(signer, "hello");
  result         = verifier.VerifySimple("hello", sig, "not-an-address");
  assert(result.failure == VerifyFailure::InvalidExpectedAddress);
  assert(result.recovered_address == signer.mainnet);
}

void TestSimpleSignature() {
  const auto              signer = NewSigner();
  const SignatureVerifier verifier(Network::Mainnet);
  const auto              sig = SignSimple(signer, "register https://api.example.com/x");

  assert(verifier.VerifySimple("register https://api.example.com/x", sig, signer.mainnet).valid);
  assert(!verifier.VerifySimple("register https://api.example.com/y", sig, signer.mainnet).valid);
}

void TestRecoveredAddressUsesConfiguredNetwork() {
  const auto              signer = NewSigner();
  const SignatureVerifier verifier(Network::Testnet);
  const auto              sig = SignSimple(signer, "hi");

  // expected address given in mainnet form still matches by fingerprint
  const auto result = verifier.VerifySimple("hi", sig, signer.mainnet);
  assert(result.valid);
  assert(result.recovered_address == signer.testnet);
}

} // namespace

int main() {
  TestStructuredSignatureVerifies();
  TestStructuredSignatureIsDomainSeparated();
  TestTamperedMessageOrSignatureFails();
  TestWrongSignerIsAddressMismatch();
  TestMalformedInputsNeverThrow();
  TestSimpleSignature();
  TestRecoveredAddressUsesConfiguredNetwork();

  std::cout << "x402_unit_signature_verifier: pass\n";
  return 0;
}
