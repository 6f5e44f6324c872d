#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace x402::util {

using Bytes = std::vector<uint8_t>;

std::string ToHex(const uint8_t* data, std::size_t size);
std::string ToHex(const Bytes& bytes);

// Accepts upper or lower case and an optional "0x" prefix.
std::optional<Bytes> FromHex(std::string_view hex);

std::string_view StripHexPrefix(std::string_view hex);

} // namespace x402::util
