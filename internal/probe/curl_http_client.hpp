#pragma once

#include <string>

#include "internal/probe/http_client.hpp"

namespace x402::probe {

// libcurl easy-handle client; one handle per request.
class CurlHttpClient final : public HttpClient {
 public:
  explicit CurlHttpClient(std::string user_agent = "x402-registry-probe/1.0");

  HttpResponse Send(const HttpRequest& request) override;

 private:
  std::string user_agent_;
};

} // namespace x402::probe
