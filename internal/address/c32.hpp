#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace x402::address {

/*
  Crockford-style base32 ("c32") as used by Stacks addresses.

  Encoding treats the input as one big-endian integer and writes its minimal base32
  representation, prefixed with one '0' per leading zero byte. Decoding is the inverse,
  case-insensitive, and maps 'O' to '0' and 'L'/'I' to '1'.
*/

inline constexpr std::string_view kC32Alphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

std::string C32Encode(const std::vector<uint8_t>& data);

// nullopt on characters outside the alphabet.
std::optional<std::vector<uint8_t>> C32Decode(std::string_view text);

struct C32CheckPayload {
  uint8_t              version{0};
  std::vector<uint8_t> data;
};

// c32(version) ++ c32(data ++ sha256d(version ++ data)[0..4]); version must be 0..31.
std::string C32CheckEncode(uint8_t version, const std::vector<uint8_t>& data);

// nullopt on a bad alphabet character, a short payload or a checksum mismatch.
std::optional<C32CheckPayload> C32CheckDecode(std::string_view text);

} // namespace x402::address
