#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/kv_store.hpp"
#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_kv_store.hpp"

namespace {

using x402::db::ErrorCode;
using x402::db::KeyValueStore;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                          name;
  std::function<std::shared_ptr<KeyValueStore>()>      make_store;
  std::function<bool()>                                supports_restart;
  std::function<void(std::shared_ptr<KeyValueStore>&)> restart;
  std::function<void()>                                cleanup;
};

void VerifyPutGetDelete(KeyValueStore& kv, const std::string& prefix) {
  const auto key = prefix + ":basic";

  assert(!kv.Get(key).has_value());
  assert(kv.Put(key, "one"));

  const auto first = kv.Get(key);
  assert(first.has_value());
  assert(first->value == "one");
  assert(first->version > 0);

  assert(kv.Put(key, "two"));
  const auto second = kv.Get(key);
  assert(second->value == "two");
  assert(second->version > first->version);

  assert(kv.Delete(key));
  assert(!kv.Get(key).has_value());

  const auto missing = kv.Delete(key);
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);
}

void VerifyPutIfAbsent(KeyValueStore& kv, const std::string& prefix) {
  const auto key = prefix + ":claim";

  assert(kv.PutIfAbsent(key, "first"));
  const auto taken = kv.PutIfAbsent(key, "second");
  assert(!taken);
  assert(taken.code == ErrorCode::AlreadyExists);
  assert(kv.Get(key)->value == "first");
}

void VerifyCompareAndSwap(KeyValueStore& kv, const std::string& prefix) {
  const auto key = prefix + ":cas";

  const auto absent = kv.CompareAndSwap(key, "x", 1);
  assert(absent.code == ErrorCode::NotFound);

  assert(kv.Put(key, "v1"));
  const auto v1 = kv.Get(key)->version;

  assert(kv.CompareAndSwap(key, "v2", v1));
  const auto v2 = kv.Get(key);
  assert(v2->value == "v2");
  assert(v2->version != v1);

  const auto stale = kv.CompareAndSwap(key, "v3", v1);
  assert(stale.code == ErrorCode::VersionMismatch);
  assert(kv.Get(key)->value == "v2");
}

void VerifyDeleteIfVersion(KeyValueStore& kv, const std::string& prefix) {
  const auto key = prefix + ":div";

  assert(kv.Put(key, "a"));
  const auto v1 = kv.Get(key)->version;
  assert(kv.Put(key, "b"));

  assert(kv.DeleteIfVersion(key, v1).code == ErrorCode::VersionMismatch);
  assert(kv.Get(key).has_value());

  assert(kv.DeleteIfVersion(key, kv.Get(key)->version));
  assert(kv.DeleteIfVersion(key, v1).code == ErrorCode::NotFound);
}

void VerifyVersionsNeverRepeat(KeyValueStore& kv, const std::string& prefix) {
  const auto key = prefix + ":recreate";

  assert(kv.Put(key, "old"));
  const auto old_version = kv.Get(key)->version;
  assert(kv.Delete(key));
  assert(kv.PutIfAbsent(key, "new"));

  // the recreated key must not satisfy a condition taken before the delete
  assert(kv.Get(key)->version != old_version);
  assert(kv.DeleteIfVersion(key, old_version).code == ErrorCode::VersionMismatch);

  std::set<uint64_t> seen;
  for (int i = 0; i < 20; ++i) {
    const auto k = prefix + ":unique:" + std::to_string(i);
    assert(kv.Put(k, "v"));
    assert(seen.insert(kv.Get(k)->version).second);
  }
}

void VerifyListByPrefix(KeyValueStore& kv, const std::string& prefix) {
  const auto base = prefix + ":list:";
  assert(kv.Put(base + "b", "2"));
  assert(kv.Put(base + "a", "1"));
  assert(kv.Put(base + "c", "3"));
  assert(kv.Put(prefix + ":listing", "outside"));
  assert(kv.Put(prefix + ":list_", "outside"));

  const auto listed = kv.ListByPrefix(base);
  assert(listed.size() == 3);
  assert(listed[0].key == base + "a" && listed[0].value == "1");
  assert(listed[1].key == base + "b");
  assert(listed[2].key == base + "c");
  assert(listed[0].version == kv.Get(base + "a")->version);

  assert(kv.ListByPrefix(prefix + ":nothing-here:").empty());

  // LIKE wildcards in the prefix are literal
  assert(kv.ListByPrefix(prefix + ":list%").empty());
}

void VerifyConcurrentClaims(KeyValueStore& kv, const std::string& prefix) {
  const auto       key = prefix + ":race";
  std::atomic<int> won{0};
  std::atomic<int> lost{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&kv, &key, &won, &lost, i]() {
      const auto result = kv.PutIfAbsent(key, std::to_string(i));
      if (result) {
        ++won;
      } else if (result.code == ErrorCode::AlreadyExists) {
        ++lost;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  assert(won.load() == 1);
  assert(lost.load() == 7);

  // every contender CASes on the same version; only one moves it
  const auto version = kv.Get(key)->version;
  won                = 0;
  threads.clear();
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&kv, &key, &won, version]() {
      if (kv.CompareAndSwap(key, "swapped", version)) {
        ++won;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  assert(won.load() == 1);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       kv  = backend.make_store();
  const auto key = prefix + ":durable";
  assert(kv->Put(key, "kept"));
  const auto version = kv->Get(key)->version;

  backend.restart(kv);

  const auto reloaded = kv->Get(key);
  assert(reloaded.has_value());
  assert(reloaded->value == "kept");
  assert(reloaded->version == version);

  // the sequence survives too
  assert(kv->Put(prefix + ":after-restart", "v"));
  assert(kv->Get(prefix + ":after-restart")->version > version);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<x402::db::memory::MemoryKeyValueStore>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<KeyValueStore>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("x402_registry_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_store = [db_path]() -> std::shared_ptr<KeyValueStore> {
    auto db = std::make_shared<x402::db::sqlite::SqliteDB>(db_path, true);
    return std::make_shared<x402::db::sqlite::SqliteKeyValueStore>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<KeyValueStore>& kv) {
        kv.reset();
        kv = make_store();
      },
      .cleanup          = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto kv = backend.make_store();

  VerifyPutGetDelete(*kv, backend.name);
  VerifyPutIfAbsent(*kv, backend.name);
  VerifyCompareAndSwap(*kv, backend.name);
  VerifyDeleteIfVersion(*kv, backend.name);
  VerifyVersionsNeverRepeat(*kv, backend.name);
  VerifyListByPrefix(*kv, backend.name);
  VerifyConcurrentClaims(*kv, backend.name);

  kv.reset();
  VerifyRestartDurability(backend, backend.name);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "x402_integration_kv_store_parity: pass\n";
  return 0;
}
