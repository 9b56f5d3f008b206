#pragma once

#include <optional>

#include "internal/engines/engine_types.hpp"

namespace beacon::engines {

/*
  Rolling uptime over [now - window, now].

  Each heartbeat in the window covers [received_at, received_at + grace],
  clipped to the window; overlapping coverage is merged before summing.
  Returns a percentage in [0, 100], or nullopt when no heartbeat falls in
  the window.
*/
std::optional<double> ComputeUptimePercent(const HeartbeatHistory& history, std::chrono::seconds grace, util::TimePoint now,
                                           std::chrono::hours window = std::chrono::hours(24));

} // namespace beacon::engines
