#pragma once

#include <optional>

#include "internal/engines/engine_types.hpp"
#include "internal/model/derived_state.hpp"

namespace beacon::engines {

/*
  quality = 0.6 * uptime + 0.3 * activity + 0.1 * (100 * confidence multiplier)

  activity is the fill rate (players / capacity, capped at 1) scaled to
  100. Capacity falls back to default_capacity when unset or zero and
  players are present. nullopt when uptime is nullopt; clamped to [0, 100].
*/
std::optional<double> ComputeQualityScore(std::optional<double> uptime_percent, std::optional<std::int64_t> players_current,
                                          std::optional<std::int64_t> players_capacity, beacon::model::Confidence confidence,
                                          std::int64_t default_capacity = kDefaultCapacity);

double ConfidenceMultiplier(beacon::model::Confidence confidence);

} // namespace beacon::engines
