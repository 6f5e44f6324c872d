#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace x402::util {

struct HttpUrl {
  std::string                scheme; // "http" or "https"
  std::string                host;   // lowercased; IPv6 literals keep their brackets
  std::optional<std::string> port;   // only when not the scheme default
  std::string                path;
  std::optional<std::string> query;

  // scheme://host[:port]path[?query]
  std::string ToString() const;
};

/*
  Parses with libcurl's URL API and normalizes: lowercase scheme and host, default port
  dropped, fragment dropped, trailing '/' removed from non-root paths. Anything that is not
  an absolute http(s) URL with a host yields nullopt.
*/
std::optional<HttpUrl> ParseHttpUrl(std::string_view url);

std::optional<std::string> NormalizeUrl(std::string_view url);

} // namespace x402::util
