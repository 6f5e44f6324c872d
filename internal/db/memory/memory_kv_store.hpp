#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/kv_store.hpp"

namespace x402::db::memory {

class MemoryKeyValueStore final : public db::KeyValueStore {
 public:
  MemoryKeyValueStore();

  std::optional<VersionedValue> Get(const std::string& key) override;
  Result                        Put(const std::string& key, const std::string& value) override;
  Result                        PutIfAbsent(const std::string& key, const std::string& value) override;
  Result                        CompareAndSwap(const std::string& key, const std::string& value, uint64_t expected_version) override;
  Result                        Delete(const std::string& key) override;
  Result                        DeleteIfVersion(const std::string& key, uint64_t expected_version) override;
  std::vector<KeyValue>         ListByPrefix(const std::string& prefix) override;

 private:
  struct Slot {
    std::string value;
    uint64_t    version = 0;
  };

  std::mutex                  mutex_;
  std::map<std::string, Slot> slots_;
  uint64_t                    next_version_ = 1;
};

} // namespace x402::db::memory
