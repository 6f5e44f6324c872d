#pragma once

#include <string>
#include <string_view>

namespace x402::util {

// Random RFC4122 v4 id in canonical lowercase form, drawn from OpenSSL's CSPRNG.
// Entry ids and challenge ids both come from here; challenge ids double as signed nonces.
std::string NewId();

// True for the 8-4-4-4-12 hex form NewId produces (either case).
bool IsId(std::string_view text);

} // namespace x402::util
