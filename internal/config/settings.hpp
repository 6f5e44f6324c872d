#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "config/config.pb.h"
#include "internal/address/address.hpp"
#include "internal/auth/replay_window.hpp"
#include "internal/auth/structured_message.hpp"

namespace x402::config {

// RuntimeConfig with defaults applied and strings parsed into typed values.
struct RegistrySettings {
  std::string               bind_address{"127.0.0.1:50051"};
  std::chrono::milliseconds shutdown_grace{std::chrono::seconds(5)};
  std::size_t               max_message_bytes = 4 * 1024 * 1024;
  std::chrono::milliseconds purge_interval{std::chrono::minutes(1)};

  address::Network network = address::Network::Mainnet;
  auth::Domain     domain;
  auth::ReplayWindow window;

  std::chrono::milliseconds challenge_ttl{std::chrono::minutes(5)};
  std::string               admin_address; // canonical, or empty
  std::string               gateway_token; // empty trusts no payment context

  std::chrono::milliseconds probe_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds register_probe_timeout{std::chrono::seconds(15)};
  std::string               user_agent{"x402-registry-probe/1.0"};
  bool                      allow_private_hosts = false;
};

// Throws std::runtime_error("Invalid configuration: ...") on unknown networks,
// malformed durations or an unparseable admin address.
RegistrySettings ResolveSettings(const x402::runtime::config::RuntimeConfig& config);

} // namespace x402::config
