#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/crypto/hash.hpp"

namespace x402::crypto {

/*
  secp256k1 ECDSA with public key recovery, through libsecp256k1's recovery module.

  Signatures travel as 65 bytes in RSV order: r (32, big-endian), s (32, big-endian),
  recovery id (1, 0..3). Public keys are always handled in compressed SEC1 form.
*/

using PrivateKey           = std::array<uint8_t, 32>;
using PublicKey            = std::array<uint8_t, 33>;
using RecoverableSignature = std::array<uint8_t, 65>;

constexpr std::size_t kRecoverableSignatureSize = 65;

// Returns the signer's compressed public key, or nullopt when r/s are out of range,
// the recovery id is not 0..3 or no curve point exists for it.
std::optional<PublicKey> RecoverPublicKey(const Sha256Digest& hash, const RecoverableSignature& signature);

// Throws std::invalid_argument when the key is zero or not below the curve order.
PublicKey DerivePublicKey(const PrivateKey& key);

// Deterministic (RFC6979) and low-s. Throws std::invalid_argument for an out-of-range key.
RecoverableSignature SignRecoverable(const Sha256Digest& hash, const PrivateKey& key);

PrivateKey GeneratePrivateKey();

// 64 hex chars, or 66 with the trailing "01" compressed-key marker.
std::optional<PrivateKey> ParsePrivateKey(std::string_view hex);

} // namespace x402::crypto
