#include "settings.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace x402::config {
namespace {

std::chrono::milliseconds DurationOr(const std::string& text, std::chrono::milliseconds fallback, const char* field) {
  if (text.empty()) {
    return fallback;
  }
  try {
    const auto parsed = util::ParseDuration(text);
    if (parsed.count() <= 0) {
      throw std::invalid_argument("must be positive");
    }
    return parsed;
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("Invalid configuration: ") + field + " '" + text + "': " + e.what());
  }
}

address::Network ParseNetwork(const std::string& name) {
  if (name.empty() || name == "mainnet") {
    return address::Network::Mainnet;
  }
  if (name == "testnet") {
    return address::Network::Testnet;
  }
  throw std::runtime_error("Invalid configuration: network must be mainnet or testnet, got '" + name + "'");
}

} // namespace

RegistrySettings ResolveSettings(const x402::runtime::config::RuntimeConfig& config) {
  RegistrySettings settings;

  const auto& server = config.server();
  if (!server.bind_address().empty()) {
    settings.bind_address = server.bind_address();
  }
  settings.shutdown_grace = DurationOr(server.shutdown_grace(), settings.shutdown_grace, "server.shutdown_grace");
  settings.purge_interval = DurationOr(server.purge_interval(), settings.purge_interval, "server.purge_interval");
  if (server.max_message_bytes() != 0) {
    settings.max_message_bytes = server.max_message_bytes();
  }

  settings.network = ParseNetwork(config.network());

  const auto& domain = config.domain();
  settings.domain    = auth::Domain::ForNetwork(settings.network, domain.name().empty() ? "stx402-registry" : domain.name(),
                                                domain.version().empty() ? "1.0.0" : domain.version());

  const auto& auth_cfg          = config.auth();
  settings.window.max_age       = DurationOr(auth_cfg.replay_window(), settings.window.max_age, "auth.replay_window");
  settings.window.future_skew   = DurationOr(auth_cfg.future_skew(), settings.window.future_skew, "auth.future_skew");
  settings.challenge_ttl        = DurationOr(auth_cfg.challenge_ttl(), settings.challenge_ttl, "auth.challenge_ttl");

  settings.gateway_token = auth_cfg.gateway_token();

  if (!auth_cfg.admin_address().empty()) {
    try {
      settings.admin_address = address::Canonicalize(auth_cfg.admin_address());
    } catch (const util::InvalidAddress& e) {
      throw std::runtime_error("Invalid configuration: auth.admin_address: " + std::string(e.what()));
    }
  }

  const auto& probe_cfg           = config.probe();
  settings.probe_timeout          = DurationOr(probe_cfg.timeout(), settings.probe_timeout, "probe.timeout");
  settings.register_probe_timeout = DurationOr(probe_cfg.register_timeout(), settings.register_probe_timeout, "probe.register_timeout");
  if (!probe_cfg.user_agent().empty()) {
    settings.user_agent = probe_cfg.user_agent();
  }
  settings.allow_private_hosts = probe_cfg.allow_private_hosts();

  return settings;
}

} // namespace x402::config
