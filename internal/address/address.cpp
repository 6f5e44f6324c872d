#include "address.hpp"

#include <algorithm>

#include "internal/address/c32.hpp"
#include "internal/crypto/hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace x402::address {
namespace {

constexpr std::size_t kMaxAddressLength = 128;

} // namespace

uint8_t SingleSigVersion(Network network) {
  return network == Network::Mainnet ? version::kMainnetSingleSig : version::kTestnetSingleSig;
}

std::optional<Address> Address::TryParse(std::string_view text) {
  if (text.size() < 6 || text.size() > kMaxAddressLength) {
    return std::nullopt;
  }
  if (text.front() != 'S' && text.front() != 's') {
    return std::nullopt;
  }

  auto payload = C32CheckDecode(text.substr(1));
  if (!payload || payload->data.size() != Fingerprint{}.size()) {
    return std::nullopt;
  }

  Fingerprint fingerprint{};
  std::copy(payload->data.begin(), payload->data.end(), fingerprint.begin());
  return Address(payload->version, fingerprint);
}

Address Address::Parse(std::string_view text) {
  auto parsed = TryParse(text);
  if (!parsed) {
    throw util::InvalidAddress("invalid address: '" + std::string(text) + "'");
  }
  return *parsed;
}

Address Address::FromFingerprint(const Fingerprint& fingerprint, uint8_t version) {
  if (version >= 32) {
    throw util::InvalidAddress("address version out of range");
  }
  return Address(version, fingerprint);
}

Address Address::FromPublicKey(const crypto::PublicKey& public_key, uint8_t version) {
  const auto hash = crypto::Hash160(std::vector<uint8_t>(public_key.begin(), public_key.end()));
  return FromFingerprint(hash, version);
}

bool Address::IsMainnet() const {
  return version_ == version::kMainnetSingleSig || version_ == version::kMainnetMultiSig;
}

std::string Address::ToString() const {
  return "S" + C32CheckEncode(version_, std::vector<uint8_t>(fingerprint_.begin(), fingerprint_.end()));
}

std::string Address::FingerprintHex() const {
  return util::ToHex(fingerprint_.data(), fingerprint_.size());
}

bool Equivalent(std::string_view a, std::string_view b) {
  const auto left  = Address::TryParse(a);
  const auto right = Address::TryParse(b);
  return left && right && left->SameIdentity(*right);
}

std::string Canonicalize(std::string_view text) {
  return Address::Parse(text).ToString();
}

} // namespace x402::address
