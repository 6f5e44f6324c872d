#include <chrono>
#include <cstdint>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/store/challenge_guard.hpp"
#include "internal/util/time.hpp"

using x402::factory::Build;
using x402::runtime::Server;
using x402::runtime::ServerOptions;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: x402-registry <config.yaml> OR x402-registry --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = x402::config::ConfigLoader::LoadFromYaml(config_path);

    x402::observability::InitializeLogging(config.logging());

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    if (app.settings.gateway_token.empty()) {
      REGISTRY_LOG_WARN("auth.gateway_token is not set; requests carrying a payment context will be refused");
    }
    services.push_back(std::make_unique<x402::grpc::RegistryServer>(app.registry_service, app.settings.gateway_token));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    ServerOptions options;
    options.bind_address      = app.settings.bind_address;
    options.max_message_bytes = app.settings.max_message_bytes;
    options.shutdown_grace    = app.settings.shutdown_grace;
    Server server(options, std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    auto last_purge = std::chrono::steady_clock::now();
    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));

      if (std::chrono::steady_clock::now() - last_purge >= app.settings.purge_interval) {
        const auto purged = app.challenges->PurgeAllExpired(x402::util::Now());
        if (purged > 0) {
          REGISTRY_LOG_DEBUG("expired challenges purged", {x402::observability::IntField("count", static_cast<std::int64_t>(purged))});
        }
        last_purge = std::chrono::steady_clock::now();
      }
    }

    REGISTRY_LOG_INFO("Shutting down x402 registry");

    server.Stop();
    x402::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    REGISTRY_LOG_ERROR("Fatal error", {x402::observability::StringField("error", e.what())});
    x402::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
