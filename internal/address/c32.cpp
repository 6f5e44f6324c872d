#include "c32.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/crypto/hash.hpp"

namespace x402::address {
namespace {

constexpr std::size_t kChecksumSize = 4;

int C32Value(char c) {
  switch (c) {
    case 'O':
    case 'o':
      return 0;
    case 'L':
    case 'l':
    case 'I':
    case 'i':
      return 1;
    default:
      break;
  }

  const char upper = (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
  const auto pos   = kC32Alphabet.find(upper);
  return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

std::vector<uint8_t> Checksum(uint8_t version, const std::vector<uint8_t>& data) {
  std::vector<uint8_t> versioned;
  versioned.reserve(data.size() + 1);
  versioned.push_back(version);
  versioned.insert(versioned.end(), data.begin(), data.end());

  const auto digest = crypto::DoubleSha256(versioned);
  return {digest.begin(), digest.begin() + kChecksumSize};
}

} // namespace

std::string C32Encode(const std::vector<uint8_t>& data) {
  std::string out;
  uint32_t    acc  = 0;
  int         bits = 0;

  for (auto it = data.rbegin(); it != data.rend(); ++it) {
    acc |= static_cast<uint32_t>(*it) << bits;
    bits += 8;
    while (bits >= 5) {
      out.push_back(kC32Alphabet[acc & 0x1F]);
      acc >>= 5;
      bits -= 5;
    }
  }
  if (bits > 0) {
    out.push_back(kC32Alphabet[acc & 0x1F]);
  }

  while (!out.empty() && out.back() == '0') {
    out.pop_back();
  }

  const auto leading_zero_bytes = std::find_if(data.begin(), data.end(), [](uint8_t b) { return b != 0; }) - data.begin();
  out.append(static_cast<std::size_t>(leading_zero_bytes), '0');

  std::reverse(out.begin(), out.end());
  return out;
}

std::optional<std::vector<uint8_t>> C32Decode(std::string_view text) {
  std::vector<int> digits;
  digits.reserve(text.size());
  for (char c : text) {
    const int value = C32Value(c);
    if (value < 0) {
      return std::nullopt;
    }
    digits.push_back(value);
  }

  const auto leading_zero_digits = std::find_if(digits.begin(), digits.end(), [](int d) { return d != 0; }) - digits.begin();

  std::vector<uint8_t> out;
  uint32_t             acc  = 0;
  int                  bits = 0;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    acc |= static_cast<uint32_t>(*it) << bits;
    bits += 5;
    if (bits >= 8) {
      out.push_back(static_cast<uint8_t>(acc & 0xFF));
      acc >>= 8;
      bits -= 8;
    }
  }
  if (bits > 0) {
    out.push_back(static_cast<uint8_t>(acc & 0xFF));
  }

  while (!out.empty() && out.back() == 0) {
    out.pop_back();
  }
  out.insert(out.end(), static_cast<std::size_t>(leading_zero_digits), 0);

  std::reverse(out.begin(), out.end());
  return out;
}

std::string C32CheckEncode(uint8_t version, const std::vector<uint8_t>& data) {
  if (version >= 32) {
    throw std::invalid_argument("c32check version must be below 32");
  }

  std::vector<uint8_t> payload = data;
  const auto           check   = Checksum(version, data);
  payload.insert(payload.end(), check.begin(), check.end());

  std::string out(1, kC32Alphabet[version]);
  out += C32Encode(payload);
  return out;
}

std::optional<C32CheckPayload> C32CheckDecode(std::string_view text) {
  if (text.size() < 2) {
    return std::nullopt;
  }

  const int version = C32Value(text.front());
  if (version < 0) {
    return std::nullopt;
  }

  auto payload = C32Decode(text.substr(1));
  if (!payload || payload->size() < kChecksumSize) {
    return std::nullopt;
  }

  C32CheckPayload result;
  result.version = static_cast<uint8_t>(version);
  result.data.assign(payload->begin(), payload->end() - kChecksumSize);

  const std::vector<uint8_t> provided(payload->end() - kChecksumSize, payload->end());
  if (Checksum(result.version, result.data) != provided) {
    return std::nullopt;
  }
  return result;
}

} // namespace x402::address
