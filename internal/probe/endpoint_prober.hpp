#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/probe/http_client.hpp"
#include "internal/util/time.hpp"
#include "x402/registry/v1/types.pb.h"

namespace x402::probe {

enum class ProbeOutcome {
  Confirmed,    // answered 402
  NonCompliant, // answered, but not with 402
  Unreachable,
  Timeout,
  Rejected, // refused before any I/O (bad URL or private host)
};

std::string_view ProbeOutcomeName(ProbeOutcome outcome);

struct ProbeResult {
  ProbeOutcome outcome{ProbeOutcome::Unreachable};
  bool         is_x402_endpoint = false;

  std::string                        payment_address;
  std::vector<std::string>           accepted_tokens;
  std::map<std::string, std::string> prices;
  std::vector<std::string>           supported_methods;

  std::optional<google::protobuf::Struct> open_api_schema;

  std::chrono::milliseconds  response_time{0};
  util::TimePoint            probed_at;
  std::optional<std::string> error;

  // The endpoint answered at all (any HTTP status).
  bool reached() const {
    return outcome == ProbeOutcome::Confirmed || outcome == ProbeOutcome::NonCompliant;
  }

  x402::registry::v1::ProbeData   ToProbeData() const;
  x402::registry::v1::ProbeReport ToReport() const;
  x402::registry::v1::LiveStatus  ToLiveStatus() const;
};

struct ProberOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds(10)};
  bool                      allow_private_hosts = false;
};

/*
  Classifies a URL as an x402 endpoint or not.

  POST {} first; anything but 402 falls back to GET. A 402 body is parsed for payment
  requirements (an "accepts" list, or flat paymentAddress/payTo/address fields). After a
  POST 402 an OPTIONS request discovers the Allow header.

  One deadline covers every request of a probe. Never throws and never retries.
*/
class EndpointProber {
 public:
  EndpointProber(std::shared_ptr<HttpClient> client, ProberOptions options = {});

  ProbeResult Probe(const std::string& url) const;
  ProbeResult Probe(const std::string& url, std::chrono::milliseconds timeout) const;

  const ProberOptions& options() const {
    return options_;
  }

 private:
  ProbeResult Run(const std::string& url, std::chrono::milliseconds timeout) const;

  std::shared_ptr<HttpClient> client_;
  ProberOptions               options_;
};

} // namespace x402::probe
