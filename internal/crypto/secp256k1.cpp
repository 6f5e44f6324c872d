#include "secp256k1.hpp"

#include <openssl/rand.h>

extern "C" {
#include <secp256k1.h>
#include <secp256k1_recovery.h>
}

#include <algorithm>
#include <memory>
#include <stdexcept>

#include "internal/util/hex.hpp"

namespace x402::crypto {
namespace {

struct ContextDeleter {
  void operator()(secp256k1_context* ctx) const {
    secp256k1_context_destroy(ctx);
  }
};

using ContextPtr = std::unique_ptr<secp256k1_context, ContextDeleter>;

ContextPtr CreateContext() {
  ContextPtr ctx(secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY));
  if (!ctx) {
    throw std::runtime_error("secp256k1_context_create failed");
  }

  // blinding for the signing path
  std::array<uint8_t, 32> seed{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1 || secp256k1_context_randomize(ctx.get(), seed.data()) != 1) {
    throw std::runtime_error("secp256k1 context randomization failed");
  }
  return ctx;
}

// read-only after creation, so shared between threads
const secp256k1_context* Context() {
  static const ContextPtr ctx = CreateContext();
  return ctx.get();
}

bool ValidKey(const PrivateKey& key) {
  return secp256k1_ec_seckey_verify(Context(), key.data()) == 1;
}

PublicKey Serialize(const secp256k1_pubkey& pubkey) {
  PublicKey   out{};
  std::size_t size = out.size();
  if (secp256k1_ec_pubkey_serialize(Context(), out.data(), &size, &pubkey, SECP256K1_EC_COMPRESSED) != 1 || size != out.size()) {
    throw std::runtime_error("public key encoding failed");
  }
  return out;
}

} // namespace

std::optional<PublicKey> RecoverPublicKey(const Sha256Digest& hash, const RecoverableSignature& signature) {
  const int recovery_id = signature[64];
  if (recovery_id > 3) {
    return std::nullopt;
  }

  // fails when r or s is not below the curve order
  secp256k1_ecdsa_recoverable_signature parsed;
  if (secp256k1_ecdsa_recoverable_signature_parse_compact(Context(), &parsed, signature.data(), recovery_id) != 1) {
    return std::nullopt;
  }

  secp256k1_pubkey pubkey;
  if (secp256k1_ecdsa_recover(Context(), &pubkey, &parsed, hash.data()) != 1) {
    return std::nullopt;
  }
  return Serialize(pubkey);
}

PublicKey DerivePublicKey(const PrivateKey& key) {
  secp256k1_pubkey pubkey;
  if (!ValidKey(key) || secp256k1_ec_pubkey_create(Context(), &pubkey, key.data()) != 1) {
    throw std::invalid_argument("private key is out of range");
  }
  return Serialize(pubkey);
}

RecoverableSignature SignRecoverable(const Sha256Digest& hash, const PrivateKey& key) {
  if (!ValidKey(key)) {
    throw std::invalid_argument("private key is out of range");
  }

  // RFC6979 nonces; libsecp256k1 always produces low-s
  secp256k1_ecdsa_recoverable_signature signature;
  if (secp256k1_ecdsa_sign_recoverable(Context(), &signature, hash.data(), key.data(), secp256k1_nonce_function_rfc6979, nullptr) != 1) {
    throw std::runtime_error("signing failed");
  }

  RecoverableSignature out{};
  int                  recovery_id = 0;
  if (secp256k1_ecdsa_recoverable_signature_serialize_compact(Context(), out.data(), &recovery_id, &signature) != 1) {
    throw std::runtime_error("signature encoding failed");
  }
  out[64] = static_cast<uint8_t>(recovery_id);
  return out;
}

PrivateKey GeneratePrivateKey() {
  PrivateKey key{};
  do {
    if (RAND_priv_bytes(key.data(), static_cast<int>(key.size())) != 1) {
      throw std::runtime_error("key generation failed");
    }
  } while (!ValidKey(key));
  return key;
}

std::optional<PrivateKey> ParsePrivateKey(std::string_view hex) {
  auto bytes = util::FromHex(hex);
  if (!bytes) {
    return std::nullopt;
  }
  if (bytes->size() == 33 && bytes->back() == 0x01) {
    bytes->pop_back();
  }
  if (bytes->size() != 32) {
    return std::nullopt;
  }

  PrivateKey key{};
  std::copy(bytes->begin(), bytes->end(), key.begin());
  return key;
}

} // namespace x402::crypto
