#include "challenge_guard.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/store/keys.hpp"
#include "internal/store/record_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace x402::store {

using x402::registry::v1::ChallengeRecord;

auth::ChallengeView ChallengeTicket::View() const {
  auth::ChallengeView view;
  view.id         = record.id();
  view.owner      = record.owner();
  view.expires_at = util::FromProto(record.expires_at());

  // a stored action that no longer parses can never match a request
  if (auto kind = auth::ParseActionName(record.action())) {
    view.action = *kind;
  }
  return view;
}

ChallengeGuard::ChallengeGuard(std::shared_ptr<db::KeyValueStore> kv, std::chrono::milliseconds ttl) : kv_(std::move(kv)), ttl_(ttl) {
  if (!kv_) {
    throw std::invalid_argument("ChallengeGuard: key-value store is required");
  }
}

ChallengeRecord ChallengeGuard::Issue(const std::string& owner, auth::ActionKind action, util::TimePoint now) {
  if (action != auth::ActionKind::DeleteEndpoint && action != auth::ActionKind::TransferOwnership) {
    throw util::InvalidArgument("challenges are only issued for delete-endpoint and transfer-ownership, got " + std::string(auth::ActionName(action)));
  }

  PurgeExpired(owner, now);

  ChallengeRecord record;
  record.set_id(util::NewId());
  record.set_owner(owner);
  record.set_action(std::string(auth::ActionName(action)));
  *record.mutable_issued_at()  = util::ToProto(now);
  *record.mutable_expires_at() = util::ToProto(now + ttl_);

  const auto key    = keys::Challenge(owner, record.id());
  const auto result = kv_->PutIfAbsent(key, EncodeRecord(record));
  if (!result) {
    throw std::runtime_error("failed to store challenge: " + std::string(db::ErrorCodeName(result.code)) + " " + result.message);
  }

  REGISTRY_LOG_DEBUG("challenge issued", {observability::StringField("owner", owner), observability::StringField("action", record.action()),
                                          observability::StringField("challenge_id", record.id())});
  return record;
}

std::optional<ChallengeTicket> ChallengeGuard::Lookup(const std::string& owner, const std::string& challenge_id) {
  // nonces that could never have been issued are not looked up
  if (!util::IsId(challenge_id)) {
    return std::nullopt;
  }

  const auto key    = keys::Challenge(owner, challenge_id);
  auto       stored = kv_->Get(key);
  if (!stored) {
    return std::nullopt;
  }

  ChallengeTicket ticket;
  ticket.key     = key;
  ticket.version = stored->version;
  ticket.record  = DecodeRecord<ChallengeRecord>(stored->value);
  return ticket;
}

db::Result ChallengeGuard::Consume(const ChallengeTicket& ticket) {
  return kv_->DeleteIfVersion(ticket.key, ticket.version);
}

std::optional<ChallengeTicket> ChallengeGuard::Restore(const ChallengeTicket& ticket) {
  const auto result = kv_->PutIfAbsent(ticket.key, EncodeRecord(ticket.record));
  if (!result) {
    REGISTRY_LOG_WARN("challenge restore failed", {observability::StringField("challenge_id", ticket.record.id()),
                                                   observability::StringField("code", db::ErrorCodeName(result.code))});
    return std::nullopt;
  }

  auto stored = kv_->Get(ticket.key);
  if (!stored) {
    return std::nullopt;
  }

  ChallengeTicket restored = ticket;
  restored.version         = stored->version;
  return restored;
}

std::size_t ChallengeGuard::PurgeExpired(const std::string& owner, util::TimePoint now) {
  return PurgePrefix(keys::OwnerChallenges(owner), now);
}

std::size_t ChallengeGuard::PurgeAllExpired(util::TimePoint now) {
  return PurgePrefix(std::string(keys::kChallengePrefix), now);
}

std::size_t ChallengeGuard::PurgePrefix(const std::string& prefix, util::TimePoint now) {
  std::size_t purged = 0;

  for (const auto& kv : kv_->ListByPrefix(prefix)) {
    ChallengeRecord record;
    try {
      record = DecodeRecord<ChallengeRecord>(kv.value);
    } catch (const std::runtime_error& e) {
      REGISTRY_LOG_WARN("dropping unreadable challenge", {observability::StringField("key", kv.key), observability::StringField("error", e.what())});
      if (kv_->DeleteIfVersion(kv.key, kv.version)) {
        ++purged;
      }
      continue;
    }

    if (util::FromProto(record.expires_at()) > now) {
      continue;
    }

    // a concurrent consume may win; that is fine
    if (kv_->DeleteIfVersion(kv.key, kv.version)) {
      ++purged;
    }
  }

  if (purged > 0) {
    REGISTRY_LOG_DEBUG("expired challenges purged", {observability::StringField("prefix", prefix), observability::IntField("count", static_cast<int64_t>(purged))});
  }
  return purged;
}

} // namespace x402::store
