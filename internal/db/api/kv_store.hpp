#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"

namespace x402::db {

struct VersionedValue {
  std::string value;
  uint64_t    version = 0;
};

struct KeyValue {
  std::string key;
  std::string value;
  uint64_t    version = 0;
};

/*
  Key-value collaborator.

  Semantics guaranteed for ALL backends:

  - read-after-write consistency per key
  - every successful write assigns the key a version never used before
    by any key in the store, so a deleted-then-recreated key never
    matches a stale expected version
  - conditional operations are atomic per key; there are no multi-key
    transactions

  Memory: mutex-guarded ordered map
  SQLite: one statement group under BEGIN IMMEDIATE
*/
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual std::optional<VersionedValue> Get(const std::string& key) = 0;

  // unconditional upsert
  virtual Result Put(const std::string& key, const std::string& value) = 0;

  // AlreadyExists when the key is present
  virtual Result PutIfAbsent(const std::string& key, const std::string& value) = 0;

  // NotFound when absent, VersionMismatch when the version moved
  virtual Result CompareAndSwap(const std::string& key, const std::string& value, uint64_t expected_version) = 0;

  // NotFound when absent
  virtual Result Delete(const std::string& key) = 0;

  // NotFound when absent, VersionMismatch when the version moved
  virtual Result DeleteIfVersion(const std::string& key, uint64_t expected_version) = 0;

  // ordered by key
  virtual std::vector<KeyValue> ListByPrefix(const std::string& prefix) = 0;
};

} // namespace x402::db
