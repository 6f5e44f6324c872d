#include "endpoint_prober.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/probe/host_guard.hpp"
#include "internal/util/url.hpp"

namespace x402::probe {
namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

constexpr long kPaymentRequired = 402;

struct PaymentRequirements {
  std::string                        payment_address;
  std::vector<std::string>           accepted_tokens;
  std::map<std::string, std::string> prices;
};

const Value* Field(const Struct& object, const char* key) {
  auto it = object.fields().find(key);
  return it == object.fields().end() ? nullptr : &it->second;
}

std::optional<std::string> NonEmptyString(const Struct& object, const char* key) {
  const Value* v = Field(object, key);
  if (v && v->kind_case() == Value::kStringValue && !v->string_value().empty()) {
    return v->string_value();
  }
  return std::nullopt;
}

std::string ScalarText(const Value& value) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      return value.string_value();
    case Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case Value::kNumberValue: {
      const double n = value.number_value();
      if (std::floor(n) == n && std::fabs(n) < 1e15) {
        return std::to_string(static_cast<long long>(n));
      }
      std::ostringstream out;
      out << n;
      return out.str();
    }
    default:
      return {};
  }
}

std::optional<PaymentRequirements> ParseRequirements(const Struct& body) {
  if (const Value* accepts = Field(body, "accepts"); accepts && accepts->kind_case() == Value::kListValue) {
    PaymentRequirements req;

    for (const auto& item : accepts->list_value().values()) {
      if (item.kind_case() != Value::kStructValue) {
        continue;
      }
      const Struct& accept = item.struct_value();

      const Value* scheme = Field(accept, "scheme");
      const Value* token  = Field(accept, "token");
      const bool   typed  = (scheme && scheme->kind_case() == Value::kStringValue) || (token && token->kind_case() == Value::kStringValue);
      if (!typed) {
        continue;
      }

      std::string name = NonEmptyString(accept, "scheme").value_or(NonEmptyString(accept, "token").value_or("unknown"));
      req.accepted_tokens.push_back(name);

      if (const Value* amount = Field(accept, "maxAmountRequired")) {
        req.prices[name] = ScalarText(*amount);
      } else if (const Value* fallback = Field(accept, "amount")) {
        req.prices[name] = ScalarText(*fallback);
      }

      if (req.payment_address.empty()) {
        req.payment_address = NonEmptyString(accept, "payTo").value_or(NonEmptyString(accept, "address").value_or(""));
      }
    }

    if (!req.accepted_tokens.empty()) {
      return req;
    }
  }

  auto direct = NonEmptyString(body, "paymentAddress");
  if (!direct) {
    direct = NonEmptyString(body, "payTo");
  }
  if (!direct) {
    direct = NonEmptyString(body, "address");
  }
  if (!direct) {
    return std::nullopt;
  }

  PaymentRequirements req;
  req.payment_address = *direct;

  if (const Value* tokens = Field(body, "tokens"); tokens && tokens->kind_case() == Value::kListValue) {
    for (const auto& t : tokens->list_value().values()) {
      req.accepted_tokens.push_back(ScalarText(t));
    }
  } else {
    req.accepted_tokens.push_back("unknown");
  }

  if (const Value* price = Field(body, "price"); price && price->kind_case() == Value::kStructValue) {
    for (const auto& [token, amount] : price->struct_value().fields()) {
      req.prices[token] = ScalarText(amount);
    }
  }
  return req;
}

std::optional<Struct> ParseBody(const std::string& body) {
  if (body.empty()) {
    return std::nullopt;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Struct parsed;
  if (!google::protobuf::util::JsonStringToMessage(body, &parsed, options).ok()) {
    return std::nullopt;
  }
  return parsed;
}

std::vector<std::string> ParseAllow(const std::string& header) {
  std::vector<std::string> methods;
  std::stringstream        in(header);
  std::string              item;
  while (std::getline(in, item, ',')) {
    item.erase(item.begin(), std::find_if(item.begin(), item.end(), [](unsigned char c) { return !std::isspace(c); }));
    item.erase(std::find_if(item.rbegin(), item.rend(), [](unsigned char c) { return !std::isspace(c); }).base(), item.end());
    std::transform(item.begin(), item.end(), item.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (!item.empty()) {
      methods.push_back(item);
    }
  }
  return methods;
}

// Fills the result from a 402 body.
void Classify402(ProbeResult& result, const std::string& body) {
  result.outcome          = ProbeOutcome::Confirmed;
  result.is_x402_endpoint = true;

  // an unparseable 402 is still an x402 endpoint
  auto parsed = ParseBody(body);
  if (!parsed) {
    return;
  }

  if (auto req = ParseRequirements(*parsed)) {
    result.payment_address = std::move(req->payment_address);
    result.accepted_tokens = std::move(req->accepted_tokens);
    result.prices          = std::move(req->prices);
  }

  if (Field(*parsed, "schema") || Field(*parsed, "openapi") || Field(*parsed, "swagger")) {
    result.open_api_schema = std::move(*parsed);
  }
}

ProbeResult Failure(ProbeOutcome outcome, std::string error) {
  ProbeResult result;
  result.outcome   = outcome;
  result.probed_at = util::Now();
  result.error     = std::move(error);
  return result;
}

ProbeResult TransportFailure(const HttpResponse& response) {
  if (response.error == TransportError::Timeout) {
    return Failure(ProbeOutcome::Timeout, "Request timed out");
  }
  return Failure(ProbeOutcome::Unreachable, response.error_message.empty() ? "Endpoint unreachable" : response.error_message);
}

} // namespace

std::string_view ProbeOutcomeName(ProbeOutcome outcome) {
  switch (outcome) {
    case ProbeOutcome::Confirmed:
      return "confirmed";
    case ProbeOutcome::NonCompliant:
      return "non-compliant";
    case ProbeOutcome::Unreachable:
      return "unreachable";
    case ProbeOutcome::Timeout:
      return "timeout";
    case ProbeOutcome::Rejected:
      return "rejected";
  }
  return "unknown";
}

x402::registry::v1::ProbeData ProbeResult::ToProbeData() const {
  x402::registry::v1::ProbeData data;
  data.set_payment_address(payment_address);
  for (const auto& token : accepted_tokens) {
    data.add_accepted_tokens(token);
  }
  for (const auto& [token, amount] : prices) {
    (*data.mutable_prices())[token] = amount;
  }
  data.set_response_time_ms(response_time.count());
  for (const auto& method : supported_methods) {
    data.add_supported_methods(method);
  }
  *data.mutable_probe_timestamp() = util::ToProto(probed_at);
  if (open_api_schema) {
    *data.mutable_open_api_schema() = *open_api_schema;
  }
  return data;
}

x402::registry::v1::ProbeReport ProbeResult::ToReport() const {
  x402::registry::v1::ProbeReport report;
  report.set_is_x402_endpoint(is_x402_endpoint);
  report.set_outcome(std::string(ProbeOutcomeName(outcome)));
  if (is_x402_endpoint) {
    *report.mutable_data() = ToProbeData();
  }
  if (error) {
    report.set_error(*error);
  }
  report.set_response_time_ms(response_time.count());
  return report;
}

x402::registry::v1::LiveStatus ProbeResult::ToLiveStatus() const {
  x402::registry::v1::LiveStatus live;
  live.set_is_online(is_x402_endpoint);
  live.set_response_time_ms(response_time.count());
  *live.mutable_checked_at() = util::ToProto(probed_at);
  if (error) {
    live.set_error(*error);
  }
  return live;
}

EndpointProber::EndpointProber(std::shared_ptr<HttpClient> client, ProberOptions options) : client_(std::move(client)), options_(options) {
  if (!client_) {
    throw std::invalid_argument("EndpointProber: http client is required");
  }
}

ProbeResult EndpointProber::Probe(const std::string& url) const {
  return Probe(url, options_.timeout);
}

ProbeResult EndpointProber::Probe(const std::string& url, std::chrono::milliseconds timeout) const {
  ProbeResult result;
  try {
    result = Run(url, timeout);
  } catch (const std::exception& e) {
    result = Failure(ProbeOutcome::Unreachable, e.what());
  }

  if (!result.reached()) {
    REGISTRY_LOG_WARN("probe failed", {observability::StringField("url", url), observability::StringField("outcome", ProbeOutcomeName(result.outcome)),
                                       observability::StringField("error", result.error.value_or(""))});
  } else {
    REGISTRY_LOG_DEBUG("probe finished", {observability::StringField("url", url), observability::StringField("outcome", ProbeOutcomeName(result.outcome)),
                                          observability::IntField("response_time_ms", result.response_time.count())});
  }
  return result;
}

ProbeResult EndpointProber::Run(const std::string& url, std::chrono::milliseconds timeout) const {
  auto parsed = util::ParseHttpUrl(url);
  if (!parsed) {
    return Failure(ProbeOutcome::Rejected, "URL must be an absolute http or https URL");
  }
  if (!options_.allow_private_hosts) {
    if (auto reason = PrivateHostReason(parsed->host)) {
      return Failure(ProbeOutcome::Rejected, *reason);
    }
  }

  const std::string target   = parsed->ToString();
  const auto        started  = std::chrono::steady_clock::now();
  const auto        deadline = started + timeout;

  auto remaining = [&]() { return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()); };
  auto elapsed   = [&]() { return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started); };

  HttpRequest post;
  post.method  = "POST";
  post.url     = target;
  post.headers = {{"Accept", "application/json"}, {"Content-Type", "application/json"}};
  post.body    = "{}";
  post.timeout = timeout;

  const auto post_response = client_->Send(post);
  if (!post_response.ok()) {
    return TransportFailure(post_response);
  }

  ProbeResult result;

  if (post_response.status == kPaymentRequired) {
    result.response_time     = elapsed();
    result.supported_methods = {"POST"};
    Classify402(result, post_response.body);

    // method discovery is best effort
    if (remaining().count() > 0) {
      HttpRequest options;
      options.method  = "OPTIONS";
      options.url     = target;
      options.timeout = remaining();

      const auto options_response = client_->Send(options);
      if (options_response.ok()) {
        auto allow = options_response.headers.find("allow");
        if (allow != options_response.headers.end()) {
          auto methods = ParseAllow(allow->second);
          if (!methods.empty()) {
            result.supported_methods = std::move(methods);
          }
        }
      }
    }

    result.probed_at = util::Now();
    return result;
  }

  if (remaining().count() <= 0) {
    return Failure(ProbeOutcome::Timeout, "Request timed out");
  }

  HttpRequest get;
  get.method  = "GET";
  get.url     = target;
  get.headers = {{"Accept", "application/json"}};
  get.timeout = remaining();

  const auto get_response = client_->Send(get);
  if (!get_response.ok()) {
    return TransportFailure(get_response);
  }

  result.response_time = elapsed();
  result.probed_at     = util::Now();

  if (get_response.status == kPaymentRequired) {
    result.supported_methods = {"GET"};
    Classify402(result, get_response.body);
    return result;
  }

  result.outcome = ProbeOutcome::NonCompliant;
  result.error   = "Endpoint returned " + std::to_string(post_response.status) + ", expected 402 for x402 endpoint";
  return result;
}

} // namespace x402::probe
