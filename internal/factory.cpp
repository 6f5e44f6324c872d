#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "internal/auth/authorization_engine.hpp"
#include "internal/db/api/kv_store.hpp"
#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_kv_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/curl_http_client.hpp"
#include "internal/probe/endpoint_prober.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/challenge_guard.hpp"
#include "internal/store/registry_store.hpp"

namespace x402::factory {

namespace {

std::shared_ptr<db::KeyValueStore> BuildKeyValueStore(const x402::runtime::config::RuntimeConfig& config) {
  const auto& storage = config.storage();
  if (storage.has_sqlite()) {
    if (storage.sqlite().path().empty()) {
      throw std::runtime_error("Invalid configuration: storage.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(storage.sqlite().path(), storage.sqlite().wal_mode());
    REGISTRY_LOG_INFO("using sqlite storage", {observability::StringField("path", storage.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteKeyValueStore>(std::move(sqlite_db));
  }

  REGISTRY_LOG_INFO("using in-memory storage");
  return std::make_shared<db::memory::MemoryKeyValueStore>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const x402::runtime::config::RuntimeConfig& config, std::shared_ptr<probe::HttpClient> http_client) {
  Application app;
  app.settings = config::ResolveSettings(config);

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.kv         = BuildKeyValueStore(config);
  app.challenges = std::make_shared<store::ChallengeGuard>(app.kv, app.settings.challenge_ttl);
  app.store      = std::make_shared<store::RegistryStore>(app.kv, app.challenges);

  // ------------------------------------------------------------------
  // Authorization and probing
  // ------------------------------------------------------------------
  app.engine = std::make_shared<auth::AuthorizationEngine>(app.settings.network, app.settings.domain, app.settings.window);

  if (!http_client) {
    http_client = std::make_shared<probe::CurlHttpClient>(app.settings.user_agent);
  }
  probe::ProberOptions prober_options;
  prober_options.timeout             = app.settings.probe_timeout;
  prober_options.allow_private_hosts = app.settings.allow_private_hosts;
  app.prober                         = std::make_shared<probe::EndpointProber>(std::move(http_client), prober_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store                           = app.store;
  ctx.challenges                      = app.challenges;
  ctx.engine                          = app.engine;
  ctx.prober                          = app.prober;
  ctx.settings.network                = app.settings.network;
  ctx.settings.admin_address          = app.settings.admin_address;
  ctx.settings.register_probe_timeout = app.settings.register_probe_timeout;

  app.registry_service = std::make_shared<service::RegistryService>(std::move(ctx));

  return app;
}

} // namespace x402::factory
