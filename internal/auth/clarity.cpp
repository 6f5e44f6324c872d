#include "clarity.hpp"

#include "internal/util/errors.hpp"

namespace x402::auth::clarity {
namespace {

void AppendU32(Bytes& out, uint32_t value) {
  out.push_back(static_cast<uint8_t>(value >> 24));
  out.push_back(static_cast<uint8_t>(value >> 16));
  out.push_back(static_cast<uint8_t>(value >> 8));
  out.push_back(static_cast<uint8_t>(value));
}

} // namespace

Bytes UInt(uint64_t value) {
  Bytes out;
  out.reserve(17);
  out.push_back(type_id::kUInt);
  // u128 big-endian; the upper half is always zero here
  out.insert(out.end(), 8, 0);
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<uint8_t>(value >> shift));
  }
  return out;
}

Bytes StringAscii(std::string_view value) {
  for (char c : value) {
    if (static_cast<unsigned char>(c) > 0x7F) {
      throw util::InvalidArgument("non-ascii character in string-ascii value");
    }
  }

  Bytes out;
  out.reserve(5 + value.size());
  out.push_back(type_id::kStringAscii);
  AppendU32(out, static_cast<uint32_t>(value.size()));
  out.insert(out.end(), value.begin(), value.end());
  return out;
}

Tuple& Tuple::Add(std::string name, Bytes serialized_value) {
  if (name.empty() || name.size() > 128) {
    throw util::InvalidArgument("invalid tuple field name");
  }
  fields_[std::move(name)] = std::move(serialized_value);
  return *this;
}

Bytes Tuple::Serialize() const {
  Bytes out;
  out.push_back(type_id::kTuple);
  AppendU32(out, static_cast<uint32_t>(fields_.size()));
  for (const auto& [name, value] : fields_) {
    out.push_back(static_cast<uint8_t>(name.size()));
    out.insert(out.end(), name.begin(), name.end());
    out.insert(out.end(), value.begin(), value.end());
  }
  return out;
}

} // namespace x402::auth::clarity
