#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/settings.hpp"

namespace x402::db { class KeyValueStore; }
namespace x402::store { class RegistryStore; class ChallengeGuard; }
namespace x402::auth { class AuthorizationEngine; }
namespace x402::probe { class EndpointProber; class HttpClient; }
namespace x402::service { class RegistryService; }

namespace x402::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  config::RegistrySettings settings;

  std::shared_ptr<db::KeyValueStore>         kv;
  std::shared_ptr<store::ChallengeGuard>     challenges;
  std::shared_ptr<store::RegistryStore>      store;
  std::shared_ptr<auth::AuthorizationEngine> engine;
  std::shared_ptr<probe::EndpointProber>     prober;

  std::shared_ptr<service::RegistryService> registry_service;
};

/*
  Build

  Composition root: the ONLY place that knows concrete storage and HTTP types.
  A null http_client selects the libcurl client.
*/
Application Build(const x402::runtime::config::RuntimeConfig& config, std::shared_ptr<probe::HttpClient> http_client = nullptr);

} // namespace x402::factory
