#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/address/address.hpp"

namespace x402::store { class RegistryStore; class ChallengeGuard; }
namespace x402::auth { class AuthorizationEngine; }
namespace x402::probe { class EndpointProber; }

namespace x402::service {

struct ServiceSettings {
  address::Network network = address::Network::Mainnet;

  // empty disables the admin operations
  std::string admin_address;

  // probes made while registering or re-probing; the prober's own timeout covers the rest
  std::chrono::milliseconds register_probe_timeout{std::chrono::seconds(15)};
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<x402::store::RegistryStore> store;
  std::shared_ptr<x402::store::ChallengeGuard> challenges;
  std::shared_ptr<x402::auth::AuthorizationEngine> engine;
  std::shared_ptr<x402::probe::EndpointProber> prober;
  ServiceSettings settings;
};

}
