#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/auth/authorization_engine.hpp"
#include "internal/db/api/kv_store.hpp"
#include "internal/util/time.hpp"
#include "x402/registry/v1/types.pb.h"

namespace x402::store {

// A challenge as read from storage, with the version needed to consume it.
struct ChallengeTicket {
  std::string                       key;
  uint64_t                          version = 0;
  x402::registry::v1::ChallengeRecord record;

  auth::ChallengeView View() const;
};

/*
  Issues and consumes single-use challenges.

  registry:challenge:{owner}:{id}

  Consumption is a DeleteIfVersion on the exact version that was read, so two
  concurrent requests carrying the same challenge cannot both consume it.
*/
class ChallengeGuard {
 public:
  ChallengeGuard(std::shared_ptr<db::KeyValueStore> kv, std::chrono::milliseconds ttl);

  // owner must already be canonical. Only delete-endpoint and transfer-ownership are
  // accepted; anything else throws util::InvalidArgument.
  x402::registry::v1::ChallengeRecord Issue(const std::string& owner, auth::ActionKind action, util::TimePoint now);

  // Returns expired challenges too; expiry is judged by the authorization engine.
  std::optional<ChallengeTicket> Lookup(const std::string& owner, const std::string& challenge_id);

  // NotFound or VersionMismatch when someone else got there first.
  db::Result Consume(const ChallengeTicket& ticket);

  // Puts a consumed challenge back after the mutation it guarded failed. Returns the
  // ticket carrying the new version, or nullopt when the key could not be recreated.
  std::optional<ChallengeTicket> Restore(const ChallengeTicket& ticket);

  std::size_t PurgeExpired(const std::string& owner, util::TimePoint now);
  std::size_t PurgeAllExpired(util::TimePoint now);

  std::chrono::milliseconds ttl() const {
    return ttl_;
  }

 private:
  std::size_t PurgePrefix(const std::string& prefix, util::TimePoint now);

  std::shared_ptr<db::KeyValueStore> kv_;
  std::chrono::milliseconds          ttl_;
};

} // namespace x402::store
