#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace x402::auth::clarity {

/*
  Clarity consensus serialization for the value types that appear in signed messages.

  Tuples serialize their fields sorted by name, so insertion order never changes the bytes.
*/

using Bytes = std::vector<uint8_t>;

namespace type_id {
inline constexpr uint8_t kUInt        = 0x01;
inline constexpr uint8_t kTuple       = 0x0c;
inline constexpr uint8_t kStringAscii = 0x0d;
} // namespace type_id

Bytes UInt(uint64_t value);

// Throws util::InvalidArgument on bytes outside 7-bit ASCII.
Bytes StringAscii(std::string_view value);

class Tuple {
 public:
  Tuple& Add(std::string name, Bytes serialized_value);

  Tuple& AddUInt(std::string name, uint64_t value) {
    return Add(std::move(name), UInt(value));
  }
  Tuple& AddString(std::string name, std::string_view value) {
    return Add(std::move(name), StringAscii(value));
  }

  Bytes Serialize() const;

 private:
  std::map<std::string, Bytes> fields_;
};

} // namespace x402::auth::clarity
