#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

namespace x402::runtime {

struct ServerOptions {
  std::string               bind_address{"0.0.0.0:50051"};
  std::size_t               max_message_bytes = 4 * 1024 * 1024;
  std::chrono::milliseconds shutdown_grace{std::chrono::seconds(5)};
};

/*
  Owns the gRPC listener for the registry services.

  Stop() refuses new calls at once and cancels whatever is still running once
  the shutdown grace has passed. The standard health service reports SERVING
  between Start() and Stop().
*/
class Server {
 public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound; differs from the configured one when it asked for port 0.
  int bound_port() const {
    return bound_port_;
  }

 private:
  ServerOptions                                 options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           bound_port_ = 0;
};

} // namespace x402::runtime
