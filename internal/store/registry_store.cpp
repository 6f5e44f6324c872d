#include "registry_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "internal/address/address.hpp"
#include "internal/auth/authorization_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/keys.hpp"
#include "internal/store/record_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace x402::store {

using x402::registry::v1::EntryStatus;
using x402::registry::v1::RegistryEntry;
using x402::registry::v1::UrlPointer;

namespace {

// A conditional write lost to a concurrent writer; triggers the single retry.
class WriteConflict : public std::runtime_error {
 public:
  explicit WriteConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

[[noreturn]] void ThrowWriteFailure(std::string_view op, const db::Result& result) {
  const std::string msg = std::string(op) + ": " + db::ErrorCodeName(result.code) + (result.message.empty() ? "" : " " + result.message);

  if (result.Retryable()) {
    throw WriteConflict(msg);
  }
  throw std::runtime_error(msg);
}

template <typename Fn>
auto RetryOnce(std::string_view op, const std::string& url, Fn&& fn) {
  try {
    return fn();
  } catch (const WriteConflict& e) {
    REGISTRY_LOG_WARN("storage conflict, retrying", {observability::StringField("op", op), observability::StringField("url", url),
                                                     observability::StringField("error", e.what())});
  }

  try {
    return fn();
  } catch (const WriteConflict& e) {
    throw util::StorageConflict(std::string(op) + " lost a concurrent write twice: " + e.what());
  }
}

void CheckOwner(const RegistryEntry& entry, const std::string& expected_owner) {
  if (!address::Equivalent(entry.owner(), expected_owner)) {
    throw util::NotAuthorized(std::string(auth::DenyReasonText(auth::DenyReason::AddressMismatch)), "entry is not owned by " + expected_owner);
  }
}

std::vector<std::string> DistinctTags(const std::vector<std::string>& tags) {
  std::vector<std::string> out;
  for (const auto& tag : tags) {
    if (!tag.empty() && std::find(out.begin(), out.end(), tag) == out.end()) {
      out.push_back(tag);
    }
  }
  return out;
}

void SetTags(RegistryEntry& entry, const std::vector<std::string>& tags) {
  entry.clear_tags();
  for (const auto& tag : DistinctTags(tags)) {
    entry.add_tags(tag);
  }
}

} // namespace

RegistryStore::RegistryStore(std::shared_ptr<db::KeyValueStore> kv, std::shared_ptr<ChallengeGuard> challenges, std::chrono::milliseconds claim_grace)
    : kv_(std::move(kv)), challenges_(std::move(challenges)), claim_grace_(claim_grace) {
  if (!kv_ || !challenges_) {
    throw std::invalid_argument("RegistryStore: key-value store and challenge guard are required");
  }
}

// ------------------------------------------------------------
// Register
// ------------------------------------------------------------

RegistryEntry RegistryStore::Register(const NewEntry& input, util::TimePoint now) {
  const auto url_hash    = keys::HashUrl(input.url);
  const auto pointer_key = keys::UrlHash(url_hash);

  RegistryEntry entry;
  entry.set_id(util::NewId());
  entry.set_url(input.url);
  entry.set_url_hash(url_hash);
  entry.set_owner(input.owner);
  entry.set_name(input.name);
  entry.set_description(input.description);
  entry.set_category(input.category);
  SetTags(entry, input.tags);
  entry.set_status(x402::registry::v1::ENTRY_STATUS_UNVERIFIED);
  if (input.probe_data) {
    *entry.mutable_probe_data() = *input.probe_data;
  }
  *entry.mutable_registered_at() = util::ToProto(now);
  *entry.mutable_updated_at()    = util::ToProto(now);
  entry.set_registered_by(input.registered_by);

  UrlPointer pointer;
  pointer.set_owner(entry.owner());
  pointer.set_id(entry.id());
  *pointer.mutable_created_at() = util::ToProto(now);
  const auto claim_value        = EncodeRecord(pointer);

  // the claim on the url hash is the uniqueness check
  const auto claim = kv_->PutIfAbsent(pointer_key, claim_value);
  if (claim.code == db::ErrorCode::AlreadyExists) {
    TakeOverOrphanClaim(pointer_key, claim_value, input.url, now);
  } else if (!claim) {
    throw std::runtime_error("register: " + std::string(db::ErrorCodeName(claim.code)) + " " + claim.message);
  }

  const auto entry_key = keys::Entry(entry.owner(), entry.id());
  const auto written   = kv_->PutIfAbsent(entry_key, EncodeRecord(entry));
  if (!written) {
    // release the claim so the URL can be registered again
    auto held     = kv_->Get(pointer_key);
    auto released = db::Result::Err(db::ErrorCode::NotFound);
    if (held && held->value == claim_value) {
      released = kv_->DeleteIfVersion(pointer_key, held->version);
    }
    if (!released) {
      REGISTRY_LOG_ERROR("failed to release url claim", {observability::StringField("url", input.url),
                                                         observability::StringField("code", db::ErrorCodeName(released.code))});
    }
    throw std::runtime_error("register: " + std::string(db::ErrorCodeName(written.code)) + " " + written.message);
  }

  return entry;
}

void RegistryStore::TakeOverOrphanClaim(const std::string& pointer_key, const std::string& claim, const std::string& url, util::TimePoint now) {
  const std::string taken_msg = "endpoint already registered: " + url;

  auto stored = kv_->Get(pointer_key);
  if (!stored) {
    // released between the two calls
    const auto retried = kv_->PutIfAbsent(pointer_key, claim);
    if (retried) {
      return;
    }
    if (!retried.Conflict()) {
      throw std::runtime_error("register: " + std::string(db::ErrorCodeName(retried.code)) + " " + retried.message);
    }
    throw util::AlreadyRegistered(taken_msg, "", "");
  }

  const auto existing = DecodeRecord<UrlPointer>(stored->value);
  const bool live     = kv_->Get(keys::Entry(existing.owner(), existing.id())).has_value();

  // claims without created_at read as the epoch
  const auto claimed_at = existing.has_created_at() ? util::FromProto(existing.created_at()) : util::TimePoint{};
  if (live || now - claimed_at < claim_grace_) {
    throw util::AlreadyRegistered(taken_msg, existing.id(), existing.owner());
  }

  const auto taken = kv_->CompareAndSwap(pointer_key, claim, stored->version);
  if (!taken) {
    if (taken.Conflict()) {
      throw util::AlreadyRegistered(taken_msg, existing.id(), existing.owner());
    }
    throw std::runtime_error("register: " + std::string(db::ErrorCodeName(taken.code)) + " " + taken.message);
  }

  REGISTRY_LOG_WARN("took over abandoned url claim", {observability::StringField("url", url), observability::StringField("previous_id", existing.id()),
                                                      observability::StringField("previous_owner", existing.owner())});
}

// ------------------------------------------------------------
// Lookups
// ------------------------------------------------------------

std::optional<RegistryStore::Located> RegistryStore::Locate(const std::string& normalized_url) {
  const auto pointer_key = keys::UrlHash(keys::HashUrl(normalized_url));

  auto stored_pointer = kv_->Get(pointer_key);
  if (!stored_pointer) {
    return std::nullopt;
  }

  const auto pointer   = DecodeRecord<UrlPointer>(stored_pointer->value);
  const auto entry_key = keys::Entry(pointer.owner(), pointer.id());

  // a claim whose entry is not written yet (or was just moved) reads as absent
  auto stored_entry = kv_->Get(entry_key);
  if (!stored_entry) {
    return std::nullopt;
  }

  Located located;
  located.pointer_key     = pointer_key;
  located.pointer_value   = std::move(stored_pointer->value);
  located.pointer_version = stored_pointer->version;
  located.entry_key       = entry_key;
  located.entry_version   = stored_entry->version;
  located.entry           = DecodeRecord<RegistryEntry>(stored_entry->value);
  return located;
}

RegistryStore::Located RegistryStore::LocateOrThrow(const std::string& normalized_url) {
  auto located = Locate(normalized_url);
  if (!located) {
    throw util::EntryNotFound("endpoint not found: " + normalized_url);
  }
  return std::move(*located);
}

std::optional<RegistryEntry> RegistryStore::FindByUrl(const std::string& normalized_url) {
  auto located = Locate(normalized_url);
  if (!located) {
    return std::nullopt;
  }
  return std::move(located->entry);
}

std::optional<RegistryEntry> RegistryStore::FindById(const std::string& owner, const std::string& id) {
  auto stored = kv_->Get(keys::Entry(owner, id));
  if (!stored) {
    return std::nullopt;
  }
  return DecodeRecord<RegistryEntry>(stored->value);
}

std::vector<RegistryEntry> RegistryStore::ListByOwner(const std::string& owner) {
  return ListPrefix(keys::OwnerEntries(owner));
}

std::vector<RegistryEntry> RegistryStore::ListByStatus(EntryStatus status) {
  auto entries = ListAll();
  entries.erase(std::remove_if(entries.begin(), entries.end(), [status](const RegistryEntry& e) { return e.status() != status; }), entries.end());
  return entries;
}

std::vector<RegistryEntry> RegistryStore::ListAll() {
  return ListPrefix(std::string(keys::kEntryPrefix));
}

std::vector<RegistryEntry> RegistryStore::ListPrefix(const std::string& prefix) {
  std::vector<RegistryEntry> out;
  for (const auto& kv : kv_->ListByPrefix(prefix)) {
    try {
      out.push_back(DecodeRecord<RegistryEntry>(kv.value));
    } catch (const std::runtime_error& e) {
      REGISTRY_LOG_ERROR("skipping unreadable entry", {observability::StringField("key", kv.key), observability::StringField("error", e.what())});
    }
  }
  return out;
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------

RegistryEntry RegistryStore::Update(const std::string& normalized_url, const std::string& expected_owner, const EntryPatch& patch, util::TimePoint now) {
  return RetryOnce("update", normalized_url, [&]() {
    auto located = LocateOrThrow(normalized_url);
    CheckOwner(located.entry, expected_owner);

    RegistryEntry updated = located.entry;
    if (patch.name) {
      updated.set_name(*patch.name);
    }
    if (patch.description) {
      updated.set_description(*patch.description);
    }
    if (patch.category) {
      updated.set_category(*patch.category);
    }
    if (patch.tags) {
      SetTags(updated, *patch.tags);
    }
    if (patch.probe_data) {
      *updated.mutable_probe_data() = *patch.probe_data;
    }
    *updated.mutable_updated_at() = util::ToProto(now);

    const auto result = kv_->CompareAndSwap(located.entry_key, EncodeRecord(updated), located.entry_version);
    if (!result) {
      ThrowWriteFailure("update", result);
    }
    return updated;
  });
}

RegistryEntry RegistryStore::SetStatus(const std::string& normalized_url, EntryStatus status, util::TimePoint now) {
  return RetryOnce("set-status", normalized_url, [&]() {
    auto located = LocateOrThrow(normalized_url);

    RegistryEntry updated = located.entry;
    updated.set_status(status);
    *updated.mutable_updated_at() = util::ToProto(now);

    const auto result = kv_->CompareAndSwap(located.entry_key, EncodeRecord(updated), located.entry_version);
    if (!result) {
      ThrowWriteFailure("set-status", result);
    }
    return updated;
  });
}

RegistryEntry RegistryStore::Transfer(const std::string& normalized_url, const std::string& expected_owner, const std::string& new_owner,
                                      const ChallengeTicket& ticket, util::TimePoint now) {
  if (address::Equivalent(expected_owner, new_owner)) {
    throw util::InvalidArgument("new owner is the current owner");
  }

  ChallengeTicket current = ticket;

  auto moved = RetryOnce("transfer", normalized_url, [&]() {
    auto located = LocateOrThrow(normalized_url);
    CheckOwner(located.entry, expected_owner);

    ConsumeChallenge(current);

    RegistryEntry updated = located.entry;
    updated.set_owner(new_owner);
    *updated.mutable_updated_at() = util::ToProto(now);

    const auto new_key = keys::Entry(new_owner, updated.id());
    const auto written = kv_->PutIfAbsent(new_key, EncodeRecord(updated));
    if (!written) {
      RestoreChallenge(current);
      ThrowWriteFailure("transfer", written);
    }

    UrlPointer pointer;
    pointer.set_owner(new_owner);
    pointer.set_id(updated.id());
    *pointer.mutable_created_at() = util::ToProto(now);
    const auto moved_pointer      = EncodeRecord(pointer);

    const auto swapped = kv_->CompareAndSwap(located.pointer_key, moved_pointer, located.pointer_version);
    if (!swapped) {
      const auto undone = kv_->Delete(new_key);
      if (!undone) {
        REGISTRY_LOG_ERROR("failed to remove staged entry", {observability::StringField("key", new_key),
                                                             observability::StringField("code", db::ErrorCodeName(undone.code))});
      }
      RestoreChallenge(current);
      ThrowWriteFailure("transfer", swapped);
    }

    // an update that reached the old copy after it was read must not be lost
    auto removed = kv_->DeleteIfVersion(located.entry_key, located.entry_version);
    if (removed.code == db::ErrorCode::VersionMismatch) {
      if (RollBackTransfer(located, moved_pointer, new_key)) {
        RestoreChallenge(current);
        ThrowWriteFailure("transfer", removed);
      }
      REGISTRY_LOG_WARN("moved entry already in use, dropping old copy", {observability::StringField("url", normalized_url)});
      removed = kv_->Delete(located.entry_key);
    }
    if (!removed && removed.code != db::ErrorCode::NotFound) {
      REGISTRY_LOG_ERROR("failed to remove previous owner record", {observability::StringField("key", located.entry_key),
                                                                    observability::StringField("code", db::ErrorCodeName(removed.code))});
    }
    return updated;
  });

  REGISTRY_LOG_INFO("endpoint transferred", {observability::StringField("url", normalized_url), observability::StringField("from", expected_owner),
                                             observability::StringField("to", new_owner)});
  return moved;
}

RegistryEntry RegistryStore::Delete(const std::string& normalized_url, const std::string& expected_owner, const ChallengeTicket& ticket) {
  ChallengeTicket current = ticket;

  auto removed = RetryOnce("delete", normalized_url, [&]() {
    auto located = LocateOrThrow(normalized_url);
    CheckOwner(located.entry, expected_owner);

    ConsumeChallenge(current);

    // the pointer decides; a concurrent transfer or delete makes this fail
    const auto pointer_result = kv_->DeleteIfVersion(located.pointer_key, located.pointer_version);
    if (!pointer_result) {
      RestoreChallenge(current);
      ThrowWriteFailure("delete", pointer_result);
    }

    // nothing reaches the record any more, so a late update to it is moot
    auto entry_result = kv_->DeleteIfVersion(located.entry_key, located.entry_version);
    if (entry_result.code == db::ErrorCode::VersionMismatch) {
      entry_result = kv_->Delete(located.entry_key);
    }
    if (!entry_result && entry_result.code != db::ErrorCode::NotFound) {
      REGISTRY_LOG_ERROR("failed to remove deleted entry", {observability::StringField("key", located.entry_key),
                                                            observability::StringField("code", db::ErrorCodeName(entry_result.code))});
    }
    return located.entry;
  });

  REGISTRY_LOG_INFO("endpoint deleted", {observability::StringField("url", normalized_url), observability::StringField("owner", expected_owner)});
  return removed;
}

// Points the URL back at the old record and drops the staged copy. False when the
// moved pointer has been replaced since, in which case the move stands.
bool RegistryStore::RollBackTransfer(const Located& located, const std::string& moved_pointer, const std::string& staged_key) {
  auto held = kv_->Get(located.pointer_key);
  if (!held || held->value != moved_pointer) {
    return false;
  }
  if (!kv_->CompareAndSwap(located.pointer_key, located.pointer_value, held->version)) {
    return false;
  }

  const auto dropped = kv_->Delete(staged_key);
  if (!dropped) {
    REGISTRY_LOG_ERROR("failed to remove staged entry", {observability::StringField("key", staged_key),
                                                         observability::StringField("code", db::ErrorCodeName(dropped.code))});
  }
  return true;
}

// ------------------------------------------------------------
// Challenge handling
// ------------------------------------------------------------

void RegistryStore::ConsumeChallenge(const ChallengeTicket& ticket) {
  const auto result = challenges_->Consume(ticket);
  if (!result) {
    throw util::NotAuthorized(std::string(auth::DenyReasonText(auth::DenyReason::ChallengeInvalidOrConsumed)), "challenge " + ticket.record.id() + " already used");
  }
}

void RegistryStore::RestoreChallenge(ChallengeTicket& ticket) {
  if (auto restored = challenges_->Restore(ticket)) {
    ticket = std::move(*restored);
  }
}

} // namespace x402::store
