#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace beacon::util {

/*
  Time utilities. Clock source lives here.

  Components that reason about "now" take a ClockFn so tests can pin it.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Accepts RFC3339 with Z/z or numeric offsets, optional fraction and T/t/space separator.
std::optional<TimePoint> ParseRfc3339(std::string_view text);

// YYYY-MM-DDTHH:MM:SSZ, sub-second precision truncated.
std::string FormatRfc3339Utc(TimePoint tp);

} // namespace beacon::util
