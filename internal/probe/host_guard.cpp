#include "host_guard.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

namespace x402::probe {
namespace {

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::optional<std::string> Ipv4Reason(const std::array<uint8_t, 4>& octets) {
  const uint8_t a = octets[0];
  const uint8_t b = octets[1];

  if (a == 127) {
    return "Cannot probe loopback addresses";
  }
  if (a == 10 || (a == 172 && b >= 16 && b <= 31) || (a == 192 && b == 168)) {
    return "Cannot probe private IP ranges";
  }
  if (a == 169 && b == 254) {
    return "Cannot probe link-local addresses";
  }
  if (a == 0) {
    return "Cannot probe reserved addresses";
  }
  return std::nullopt;
}

} // namespace

std::optional<std::string> PrivateHostReason(std::string_view host) {
  std::string lower(host);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower.size() >= 2 && lower.front() == '[' && lower.back() == ']') {
    lower = lower.substr(1, lower.size() - 2);
  }
  while (!lower.empty() && lower.back() == '.') {
    lower.pop_back();
  }

  if (lower.empty()) {
    return "Missing host";
  }

  if (lower == "localhost" || EndsWith(lower, ".localhost")) {
    return "Cannot probe localhost";
  }
  if (EndsWith(lower, ".local") || EndsWith(lower, ".internal") || EndsWith(lower, ".corp")) {
    return "Cannot probe internal hostnames";
  }

  std::array<uint8_t, 4> v4{};
  if (inet_pton(AF_INET, lower.c_str(), v4.data()) == 1) {
    return Ipv4Reason(v4);
  }

  std::array<uint8_t, 16> v6{};
  if (inet_pton(AF_INET6, lower.c_str(), v6.data()) == 1) {
    const bool unspecified_or_loopback = std::all_of(v6.begin(), v6.end() - 1, [](uint8_t b) { return b == 0; }) && v6[15] <= 1;
    if (unspecified_or_loopback) {
      return "Cannot probe loopback addresses";
    }
    if (StartsWith(lower, "::ffff:") ||
        (std::all_of(v6.begin(), v6.begin() + 10, [](uint8_t b) { return b == 0; }) && v6[10] == 0xff && v6[11] == 0xff)) {
      return "Cannot probe IPv4-mapped IPv6 addresses";
    }
    if (v6[0] == 0xfe && (v6[1] & 0xc0) == 0x80) {
      return "Cannot probe link-local addresses";
    }
    if ((v6[0] & 0xfe) == 0xfc) {
      return "Cannot probe private IP ranges";
    }
  }

  return std::nullopt;
}

} // namespace x402::probe
