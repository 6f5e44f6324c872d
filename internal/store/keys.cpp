#include "keys.hpp"

#include "internal/crypto/hash.hpp"
#include "internal/util/hex.hpp"

namespace x402::store::keys {

std::string Entry(std::string_view owner, std::string_view id) {
  return OwnerEntries(owner) + std::string(id);
}

std::string OwnerEntries(std::string_view owner) {
  return std::string(kEntryPrefix) + std::string(owner) + ":";
}

std::string UrlHash(std::string_view url_hash) {
  return std::string(kUrlHashPrefix) + std::string(url_hash);
}

std::string Challenge(std::string_view owner, std::string_view challenge_id) {
  return OwnerChallenges(owner) + std::string(challenge_id);
}

std::string OwnerChallenges(std::string_view owner) {
  return std::string(kChallengePrefix) + std::string(owner) + ":";
}

std::string HashUrl(std::string_view normalized_url) {
  const auto digest = crypto::Sha256(normalized_url);
  return util::ToHex(digest.data(), digest.size());
}

std::string CanonicalOwner(std::string_view owner, address::Network network) {
  const auto parsed = address::Address::Parse(owner);

  uint8_t version = parsed.version();
  switch (version) {
    case address::version::kMainnetSingleSig:
    case address::version::kTestnetSingleSig:
      version = address::SingleSigVersion(network);
      break;
    case address::version::kMainnetMultiSig:
    case address::version::kTestnetMultiSig:
      version = network == address::Network::Mainnet ? address::version::kMainnetMultiSig : address::version::kTestnetMultiSig;
      break;
    default:
      break;
  }
  return address::Address::FromFingerprint(parsed.fingerprint(), version).ToString();
}

} // namespace x402::store::keys
