#pragma once

#include <optional>

#include "internal/engines/engine_types.hpp"

namespace beacon::engines {

// Derived-state snapshot; ranking never sees raw heartbeats.
struct RankingInput {
  std::optional<double>       quality_score;
  std::optional<double>       uptime_percent;
  std::optional<std::int64_t> players_current;
  std::optional<std::int64_t> players_capacity;
  bool                        anomaly_players_spike = false;
};

inline constexpr double       kAnomalyPenalty      = 20.0;
inline constexpr std::int64_t kRankingPlayersCap   = 50;
inline constexpr double       kUptimeDiminishingAt = 95.0;

// Uptime above 95 is compressed logarithmically onto (95, 100].
double EffectiveUptime(double uptime_percent);

/*
  0.5 * quality + 0.3 * effective uptime + 0.2 * capped activity,
  minus 20 when the anomaly flag is set, floored at 0. Missing inputs
  contribute 0.
*/
double ComputeRankingScore(const RankingInput& input, std::int64_t default_capacity = kDefaultCapacity);

} // namespace beacon::engines
