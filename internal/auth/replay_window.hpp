#pragma once

#include <chrono>
#include <cstdint>

#include "internal/util/time.hpp"

namespace x402::auth {

/*
  Bounded validity window for signed timestamps (unix milliseconds).

  A timestamp is fresh when  -future_skew <= now - timestamp <= max_age.
*/
struct ReplayWindow {
  std::chrono::milliseconds max_age{std::chrono::minutes(5)};
  std::chrono::milliseconds future_skew{std::chrono::seconds(30)};

  bool IsFresh(uint64_t timestamp_ms, util::TimePoint now) const {
    const auto now_ms = static_cast<int64_t>(util::ToUnixMillis(now));
    const auto age    = now_ms - static_cast<int64_t>(timestamp_ms);
    return age >= -future_skew.count() && age <= max_age.count();
  }
};

} // namespace x402::auth
