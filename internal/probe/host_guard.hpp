#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace x402::probe {

// Reason the host must not be probed, or nullopt when it is a public name or address.
// Works on the literal host only; no name resolution.
std::optional<std::string> PrivateHostReason(std::string_view host);

} // namespace x402::probe
