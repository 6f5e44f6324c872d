#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/kv_store.hpp"
#include "sqlite_db.hpp"

namespace x402::db::sqlite {

/*
  KeyValueStore over a single sqlite connection.

  Conditional writes read the current version and write inside one
  BEGIN IMMEDIATE transaction. Versions come from a persistent sequence
  row so they stay unique across deletes and restarts.
*/
class SqliteKeyValueStore final : public db::KeyValueStore {
 public:
  explicit SqliteKeyValueStore(std::shared_ptr<SqliteDB> db);

  std::optional<VersionedValue> Get(const std::string& key) override;
  Result                        Put(const std::string& key, const std::string& value) override;
  Result                        PutIfAbsent(const std::string& key, const std::string& value) override;
  Result                        CompareAndSwap(const std::string& key, const std::string& value, uint64_t expected_version) override;
  Result                        Delete(const std::string& key) override;
  Result                        DeleteIfVersion(const std::string& key, uint64_t expected_version) override;
  std::vector<KeyValue>         ListByPrefix(const std::string& prefix) override;

 private:
  template <typename Fn>
  Result Write(Fn&& fn);

  std::optional<uint64_t> CurrentVersion(const std::string& key);
  uint64_t                NextVersion();
  void                    Upsert(const std::string& key, const std::string& value, uint64_t version);
  void                    Remove(const std::string& key);

  Result Translate(int rc, const std::string& what) const;

  std::shared_ptr<SqliteDB> db_;
  // one connection; statements and transactions must not interleave
  std::mutex mutex_;
};

} // namespace x402::db::sqlite
