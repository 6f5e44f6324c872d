#include "server.hpp"

#include <grpcpp/health_check_service_interface.h>

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace x402::runtime {

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {
  if (services_.empty()) {
    throw std::invalid_argument("Server: no services to serve");
  }
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) {
    return;
  }

  ::grpc::EnableDefaultHealthCheckService(true);

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &bound_port_);
  builder.SetMaxReceiveMessageSize(static_cast<int>(options_.max_message_bytes));
  builder.SetMaxSendMessageSize(static_cast<int>(options_.max_message_bytes));

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || bound_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("Failed to start gRPC server on " + options_.bind_address);
  }

  if (auto* health = grpc_server_->GetHealthCheckService()) {
    health->SetServingStatus(true);
  }

  REGISTRY_LOG_INFO("x402 registry listening", {observability::StringField("bind_address", options_.bind_address),
                                                observability::IntField("port", bound_port_)});
}

void Server::Wait() {
  if (grpc_server_) {
    grpc_server_->Wait();
  }
}

void Server::Stop() {
  if (!grpc_server_) {
    return;
  }

  if (auto* health = grpc_server_->GetHealthCheckService()) {
    health->SetServingStatus(false);
  }
  grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
  grpc_server_.reset();

  REGISTRY_LOG_INFO("x402 registry stopped");
}

} // namespace x402::runtime
