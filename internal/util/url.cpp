#include "url.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace x402::util {
namespace {

constexpr std::size_t kMaxUrlLength = 2048;

struct UrlDeleter {
  void operator()(CURLU* handle) const {
    curl_url_cleanup(handle);
  }
};

struct CurlStringDeleter {
  void operator()(char* value) const {
    curl_free(value);
  }
};

std::optional<std::string> GetPart(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
  char* raw = nullptr;
  if (curl_url_get(handle, part, &raw, flags) != CURLUE_OK || raw == nullptr) {
    return std::nullopt;
  }
  std::unique_ptr<char, CurlStringDeleter> owned(raw);
  return std::string(owned.get());
}

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

std::string HttpUrl::ToString() const {
  std::string out = scheme + "://" + host;
  if (port) {
    out += ":" + *port;
  }
  out += path;
  if (query) {
    out += "?" + *query;
  }
  return out;
}

std::optional<HttpUrl> ParseHttpUrl(std::string_view url) {
  if (url.empty() || url.size() > kMaxUrlLength) {
    return std::nullopt;
  }

  std::unique_ptr<CURLU, UrlDeleter> handle(curl_url());
  if (!handle) {
    return std::nullopt;
  }

  const std::string input(url);
  if (curl_url_set(handle.get(), CURLUPART_URL, input.c_str(), 0) != CURLUE_OK) {
    return std::nullopt;
  }

  HttpUrl parsed;

  auto scheme = GetPart(handle.get(), CURLUPART_SCHEME);
  if (!scheme) {
    return std::nullopt;
  }
  parsed.scheme = Lower(*scheme);
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    return std::nullopt;
  }

  if (GetPart(handle.get(), CURLUPART_USER)) {
    return std::nullopt;
  }

  auto host = GetPart(handle.get(), CURLUPART_HOST);
  if (!host || host->empty()) {
    return std::nullopt;
  }
  parsed.host = Lower(*host);

  parsed.port = GetPart(handle.get(), CURLUPART_PORT, CURLU_NO_DEFAULT_PORT);

  parsed.path = GetPart(handle.get(), CURLUPART_PATH).value_or("/");
  if (parsed.path.empty()) {
    parsed.path = "/";
  }
  while (parsed.path.size() > 1 && parsed.path.back() == '/') {
    parsed.path.pop_back();
  }

  parsed.query = GetPart(handle.get(), CURLUPART_QUERY);
  if (parsed.query && parsed.query->empty()) {
    parsed.query.reset();
  }

  return parsed;
}

std::optional<std::string> NormalizeUrl(std::string_view url) {
  auto parsed = ParseHttpUrl(url);
  if (!parsed) {
    return std::nullopt;
  }
  return parsed->ToString();
}

} // namespace x402::util
