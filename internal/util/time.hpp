#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace x402::util {

// Wall clock for timestamps, expiry and the replay window. Stored times are unix milliseconds.
using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Parses "250ms", "30s", "5m", "1h" (or a bare number of milliseconds).
// Throws std::invalid_argument on anything else.
std::chrono::milliseconds ParseDuration(std::string_view text);

} // namespace x402::util
