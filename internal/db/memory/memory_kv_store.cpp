#include "memory_kv_store.hpp"

namespace x402::db::memory {

MemoryKeyValueStore::MemoryKeyValueStore() = default;

std::optional<VersionedValue> MemoryKeyValueStore::Get(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            it = slots_.find(key);
  if (it == slots_.end()) return std::nullopt;
  return VersionedValue{it->second.value, it->second.version};
}

Result MemoryKeyValueStore::Put(const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  slots_[key] = Slot{value, next_version_++};
  return Result::Ok();
}

Result MemoryKeyValueStore::PutIfAbsent(const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  if (slots_.contains(key)) return Result::Err(ErrorCode::AlreadyExists, key);
  slots_.emplace(key, Slot{value, next_version_++});
  return Result::Ok();
}

Result MemoryKeyValueStore::CompareAndSwap(const std::string& key, const std::string& value, uint64_t expected_version) {
  std::lock_guard lock(mutex_);
  auto            it = slots_.find(key);
  if (it == slots_.end()) return Result::Err(ErrorCode::NotFound, key);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::VersionMismatch, key);
  it->second = Slot{value, next_version_++};
  return Result::Ok();
}

Result MemoryKeyValueStore::Delete(const std::string& key) {
  std::lock_guard lock(mutex_);
  if (slots_.erase(key) == 0) return Result::Err(ErrorCode::NotFound, key);
  return Result::Ok();
}

Result MemoryKeyValueStore::DeleteIfVersion(const std::string& key, uint64_t expected_version) {
  std::lock_guard lock(mutex_);
  auto            it = slots_.find(key);
  if (it == slots_.end()) return Result::Err(ErrorCode::NotFound, key);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::VersionMismatch, key);
  slots_.erase(it);
  return Result::Ok();
}

std::vector<KeyValue> MemoryKeyValueStore::ListByPrefix(const std::string& prefix) {
  std::lock_guard       lock(mutex_);
  std::vector<KeyValue> out;
  for (auto it = slots_.lower_bound(prefix); it != slots_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
    out.push_back(KeyValue{it->first, it->second.value, it->second.version});
  }
  return out;
}

} // namespace x402::db::memory
