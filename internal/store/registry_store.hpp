#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/kv_store.hpp"
#include "internal/store/challenge_guard.hpp"
#include "internal/util/time.hpp"
#include "x402/registry/v1/types.pb.h"

namespace x402::store {

struct NewEntry {
  std::string              url; // normalized
  std::string              owner; // canonical
  std::string              registered_by;
  std::string              name;
  std::string              description;
  std::string              category;
  std::vector<std::string> tags;

  std::optional<x402::registry::v1::ProbeData> probe_data;
};

// Only engaged fields are applied.
struct EntryPatch {
  std::optional<std::string>              name;
  std::optional<std::string>              description;
  std::optional<std::string>              category;
  std::optional<std::vector<std::string>> tags;

  std::optional<x402::registry::v1::ProbeData> probe_data;
};

// How long a URL claim may exist without its entry before a new registration
// treats it as abandoned.
inline constexpr std::chrono::seconds kDefaultClaimGrace{30};

/*
  Owns every RegistryEntry.

  nonexistent -> unverified -> verified (re-entrant), either state -> deleted

  The URL-hash pointer is the uniqueness point: register claims it with a single
  PutIfAbsent before the entry itself is written, and delete and transfer commit
  by removing or swapping it. Entry and pointer mutations are conditional on the
  versions that were read; a lost race is retried once after re-reading and
  re-checking ownership, then surfaced as util::StorageConflict.

  A claim left behind by a register that never wrote its entry blocks the URL
  for claim_grace only.

  Owners passed in must already be canonical (keys::CanonicalOwner). Authorization
  is decided by the caller; this class only re-checks that the owner it was decided
  against still owns the entry.
*/
class RegistryStore {
 public:
  RegistryStore(std::shared_ptr<db::KeyValueStore> kv, std::shared_ptr<ChallengeGuard> challenges,
                std::chrono::milliseconds claim_grace = kDefaultClaimGrace);

  // Throws util::AlreadyRegistered when the URL is taken by a live entry or a claim
  // younger than claim_grace.
  x402::registry::v1::RegistryEntry Register(const NewEntry& entry, util::TimePoint now);

  std::optional<x402::registry::v1::RegistryEntry> FindByUrl(const std::string& normalized_url);
  std::optional<x402::registry::v1::RegistryEntry> FindById(const std::string& owner, const std::string& id);

  std::vector<x402::registry::v1::RegistryEntry> ListByOwner(const std::string& owner);
  std::vector<x402::registry::v1::RegistryEntry> ListByStatus(x402::registry::v1::EntryStatus status);
  std::vector<x402::registry::v1::RegistryEntry> ListAll();

  // Refreshes updated_at even for an empty patch.
  x402::registry::v1::RegistryEntry Update(const std::string& normalized_url, const std::string& expected_owner, const EntryPatch& patch,
                                           util::TimePoint now);

  x402::registry::v1::RegistryEntry SetStatus(const std::string& normalized_url, x402::registry::v1::EntryStatus status, util::TimePoint now);

  // Consumes the challenge before touching the entry; puts it back if the move fails.
  x402::registry::v1::RegistryEntry Transfer(const std::string& normalized_url, const std::string& expected_owner, const std::string& new_owner,
                                             const ChallengeTicket& ticket, util::TimePoint now);

  // Removing the URL pointer is the commit point. Returns the removed entry.
  x402::registry::v1::RegistryEntry Delete(const std::string& normalized_url, const std::string& expected_owner, const ChallengeTicket& ticket);

 private:
  struct Located {
    std::string                       pointer_key;
    std::string                       pointer_value;
    uint64_t                          pointer_version = 0;
    std::string                       entry_key;
    uint64_t                          entry_version = 0;
    x402::registry::v1::RegistryEntry entry;
  };

  std::optional<Located> Locate(const std::string& normalized_url);
  Located                LocateOrThrow(const std::string& normalized_url);

  std::vector<x402::registry::v1::RegistryEntry> ListPrefix(const std::string& prefix);

  void TakeOverOrphanClaim(const std::string& pointer_key, const std::string& claim, const std::string& url, util::TimePoint now);
  bool RollBackTransfer(const Located& located, const std::string& moved_pointer, const std::string& staged_key);

  void ConsumeChallenge(const ChallengeTicket& ticket);
  void RestoreChallenge(ChallengeTicket& ticket);

  std::shared_ptr<db::KeyValueStore> kv_;
  std::shared_ptr<ChallengeGuard>    challenges_;
  std::chrono::milliseconds          claim_grace_;
};

} // namespace x402::store
