#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

namespace x402::crypto {

using Sha256Digest    = std::array<uint8_t, 32>;
using Ripemd160Digest = std::array<uint8_t, 20>;

Sha256Digest Sha256(const uint8_t* data, std::size_t size);
Sha256Digest Sha256(const std::vector<uint8_t>& data);
Sha256Digest Sha256(std::string_view data);

// sha256(sha256(data))
Sha256Digest DoubleSha256(const std::vector<uint8_t>& data);

Ripemd160Digest Ripemd160(const uint8_t* data, std::size_t size);

// ripemd160(sha256(data)); the 20-byte identity fingerprint of a public key.
Ripemd160Digest Hash160(const std::vector<uint8_t>& data);

} // namespace x402::crypto
