#pragma once

#include <string>
#include <string_view>

#include "internal/address/address.hpp"

namespace x402::store::keys {

/*
  Persisted layout:

    registry:entry:{owner}:{id}          RegistryEntry (proto JSON)
    registry:url-hash:{sha256(url)}      UrlPointer {owner, id, created_at}
    registry:challenge:{owner}:{id}      ChallengeRecord
*/

inline constexpr std::string_view kEntryPrefix     = "registry:entry:";
inline constexpr std::string_view kUrlHashPrefix   = "registry:url-hash:";
inline constexpr std::string_view kChallengePrefix = "registry:challenge:";

std::string Entry(std::string_view owner, std::string_view id);
std::string OwnerEntries(std::string_view owner);
std::string UrlHash(std::string_view url_hash);
std::string Challenge(std::string_view owner, std::string_view challenge_id);
std::string OwnerChallenges(std::string_view owner);

// hex sha256 of an already normalized URL
std::string HashUrl(std::string_view normalized_url);

// Owner form used in keys and stored entries: the address re-encoded with the configured
// network's version of the same kind (single-sig or multi-sig). Throws util::InvalidAddress.
std::string CanonicalOwner(std::string_view owner, address::Network network);

} // namespace x402::store::keys
