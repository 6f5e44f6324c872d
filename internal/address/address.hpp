#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/crypto/secp256k1.hpp"

namespace x402::address {

using Fingerprint = std::array<uint8_t, 20>;

enum class Network { Mainnet, Testnet };

namespace version {
inline constexpr uint8_t kMainnetSingleSig = 22; // SP
inline constexpr uint8_t kMainnetMultiSig  = 20; // SM
inline constexpr uint8_t kTestnetSingleSig = 26; // ST
inline constexpr uint8_t kTestnetMultiSig  = 21; // SN
} // namespace version

uint8_t SingleSigVersion(Network network);

/*
  A parsed account address: 'S' + c32check(version, hash160).

  The fingerprint is the network-independent identity; two addresses carrying the same
  fingerprint under different versions belong to the same key.
*/
class Address {
 public:
  // Throws util::InvalidAddress.
  static Address Parse(std::string_view text);

  static std::optional<Address> TryParse(std::string_view text);

  static Address FromFingerprint(const Fingerprint& fingerprint, uint8_t version);
  static Address FromPublicKey(const crypto::PublicKey& public_key, uint8_t version);

  uint8_t version() const {
    return version_;
  }

  const Fingerprint& fingerprint() const {
    return fingerprint_;
  }

  bool IsMainnet() const;

  // Canonical uppercase encoding.
  std::string ToString() const;

  std::string FingerprintHex() const;

  // Same fingerprint, possibly a different version.
  bool SameIdentity(const Address& other) const {
    return fingerprint_ == other.fingerprint_;
  }

 private:
  Address(uint8_t version, const Fingerprint& fingerprint) : version_(version), fingerprint_(fingerprint) {
  }

  uint8_t     version_;
  Fingerprint fingerprint_;
};

// Never throws: false when either side fails to parse.
bool Equivalent(std::string_view a, std::string_view b);

// Canonical form of a user-supplied address; throws util::InvalidAddress.
std::string Canonicalize(std::string_view text);

} // namespace x402::address
