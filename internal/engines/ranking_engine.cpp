#include "internal/engines/ranking_engine.hpp"

#include <algorithm>
#include <cmath>

namespace beacon::engines {
namespace {

constexpr double kQualityWeight  = 0.5;
constexpr double kUptimeWeight   = 0.3;
constexpr double kActivityWeight = 0.2;

} // namespace

double EffectiveUptime(double uptime_percent) {
  const double u = std::clamp(uptime_percent, 0.0, 100.0);
  if (u <= kUptimeDiminishingAt) return u;
  return kUptimeDiminishingAt + std::log(1.0 + (u - kUptimeDiminishingAt)) / std::log(6.0) * 5.0;
}

double ComputeRankingScore(const RankingInput& input, std::int64_t default_capacity) {
  double score = 0.0;

  if (input.quality_score) {
    score += kQualityWeight * std::clamp(*input.quality_score, 0.0, 100.0);
  }

  if (input.uptime_percent) {
    score += kUptimeWeight * EffectiveUptime(*input.uptime_percent);
  }

  if (input.players_current && *input.players_current > 0) {
    const auto   capped   = std::min(*input.players_current, kRankingPlayersCap);
    const auto   capacity = input.players_capacity.value_or(0) > 0 ? *input.players_capacity : default_capacity;
    const double fill     = capacity > 0 ? std::clamp(static_cast<double>(capped) / static_cast<double>(capacity), 0.0, 1.0) : 0.0;
    score += kActivityWeight * fill * 100.0;
  }

  if (input.anomaly_players_spike) {
    score -= kAnomalyPenalty;
  }

  return std::max(0.0, score);
}

} // namespace beacon::engines
