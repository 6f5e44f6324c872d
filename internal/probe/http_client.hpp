#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace x402::probe {

struct HttpRequest {
  std::string                        method{"GET"};
  std::string                        url;
  std::map<std::string, std::string> headers;
  std::optional<std::string>         body;
  std::chrono::milliseconds          timeout{std::chrono::seconds(10)};
};

enum class TransportError { None, Timeout, Unreachable };

struct HttpResponse {
  TransportError error{TransportError::None};
  std::string    error_message;

  long                               status = 0;
  std::map<std::string, std::string> headers; // names lowercased
  std::string                        body;
  std::chrono::milliseconds          elapsed{0};

  bool ok() const {
    return error == TransportError::None;
  }
};

/*
  Outbound HTTP collaborator for the prober.

  Implementations never throw for transport failures; they report them in
  HttpResponse::error. No retries.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Send(const HttpRequest& request) = 0;
};

} // namespace x402::probe
