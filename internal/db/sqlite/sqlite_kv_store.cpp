#include "sqlite_kv_store.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "sqlite_tx.hpp"

namespace x402::db::sqlite {

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  const int            n = sqlite3_column_bytes(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(n)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static void StepDone(sqlite3* db, sqlite3_stmt* st, const char* what) {
  int rc = sqlite3_step(st);
  while (rc == SQLITE_ROW) {
    rc = sqlite3_step(st);
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteKeyValueStore::SqliteKeyValueStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

Result SqliteKeyValueStore::Translate(int rc, const std::string& what) const {
  switch (rc & 0xFF) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return Result::Err(ErrorCode::InternalError, what);
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, what);
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::StorageFailure, what);
    default:
      return Result::Err(ErrorCode::InternalError, what);
  }
}

template <typename Fn>
Result SqliteKeyValueStore::Write(Fn&& fn) {
  std::lock_guard lock(mutex_);
  try {
    SqliteTransaction tx(db_);
    Result            result = fn();
    if (result) {
      tx.Commit();
    }
    return result;
  } catch (const std::exception& e) {
    return Translate(sqlite3_extended_errcode(db_->Handle()), e.what());
  }
}

std::optional<uint64_t> SqliteKeyValueStore::CurrentVersion(const std::string& key) {
  auto st = db_->Prepare("SELECT version FROM kv WHERE key = ?1;");
  BindText(st.get(), 1, key);
  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return ColU64(st.get(), 0);
  if (rc == SQLITE_DONE) return std::nullopt;
  throw std::runtime_error(std::string("kv version lookup: ") + sqlite3_errmsg(db_->Handle()));
}

uint64_t SqliteKeyValueStore::NextVersion() {
  auto st = db_->Prepare("UPDATE kv_sequence SET value = value + 1 WHERE name = 'version' RETURNING value;");
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("kv version sequence: ") + sqlite3_errmsg(db_->Handle()));
  }
  const uint64_t version = ColU64(st.get(), 0);
  StepDone(db_->Handle(), st.get(), "kv version sequence");
  return version;
}

void SqliteKeyValueStore::Upsert(const std::string& key, const std::string& value, uint64_t version) {
  auto st = db_->Prepare(
      "INSERT INTO kv(key, value, version) VALUES(?1, ?2, ?3) "
      "ON CONFLICT(key) DO UPDATE SET value = excluded.value, version = excluded.version;");
  BindText(st.get(), 1, key);
  BindText(st.get(), 2, value);
  BindU64(st.get(), 3, version);
  StepDone(db_->Handle(), st.get(), "kv upsert");
}

void SqliteKeyValueStore::Remove(const std::string& key) {
  auto st = db_->Prepare("DELETE FROM kv WHERE key = ?1;");
  BindText(st.get(), 1, key);
  StepDone(db_->Handle(), st.get(), "kv delete");
}

std::optional<VersionedValue> SqliteKeyValueStore::Get(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            st = db_->Prepare("SELECT value, version FROM kv WHERE key = ?1;");
  BindText(st.get(), 1, key);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) {
    return VersionedValue{ColText(st.get(), 0), ColU64(st.get(), 1)};
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("kv get: ") + sqlite3_errmsg(db_->Handle()));
  }
  return std::nullopt;
}

Result SqliteKeyValueStore::Put(const std::string& key, const std::string& value) {
  return Write([&] {
    Upsert(key, value, NextVersion());
    return Result::Ok();
  });
}

Result SqliteKeyValueStore::PutIfAbsent(const std::string& key, const std::string& value) {
  return Write([&] {
    if (CurrentVersion(key)) return Result::Err(ErrorCode::AlreadyExists, key);
    Upsert(key, value, NextVersion());
    return Result::Ok();
  });
}

Result SqliteKeyValueStore::CompareAndSwap(const std::string& key, const std::string& value, uint64_t expected_version) {
  return Write([&] {
    auto current = CurrentVersion(key);
    if (!current) return Result::Err(ErrorCode::NotFound, key);
    if (*current != expected_version) return Result::Err(ErrorCode::VersionMismatch, key);
    Upsert(key, value, NextVersion());
    return Result::Ok();
  });
}

Result SqliteKeyValueStore::Delete(const std::string& key) {
  return Write([&] {
    if (!CurrentVersion(key)) return Result::Err(ErrorCode::NotFound, key);
    Remove(key);
    return Result::Ok();
  });
}

Result SqliteKeyValueStore::DeleteIfVersion(const std::string& key, uint64_t expected_version) {
  return Write([&] {
    auto current = CurrentVersion(key);
    if (!current) return Result::Err(ErrorCode::NotFound, key);
    if (*current != expected_version) return Result::Err(ErrorCode::VersionMismatch, key);
    Remove(key);
    return Result::Ok();
  });
}

std::vector<KeyValue> SqliteKeyValueStore::ListByPrefix(const std::string& prefix) {
  std::lock_guard lock(mutex_);
  auto            st = db_->Prepare(
      "SELECT key, value, version FROM kv "
      "WHERE key >= ?1 AND substr(key, 1, length(?1)) = ?1 ORDER BY key;");
  BindText(st.get(), 1, prefix);

  std::vector<KeyValue> out;
  int                   rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(KeyValue{ColText(st.get(), 0), ColText(st.get(), 1), ColU64(st.get(), 2)});
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("kv list: ") + sqlite3_errmsg(db_->Handle()));
  }
  return out;
}

} // namespace x402::db::sqlite
