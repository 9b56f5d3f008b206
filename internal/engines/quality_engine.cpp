#include "internal/engines/quality_engine.hpp"

#include <algorithm>

namespace beacon::engines {
namespace {

constexpr double kUptimeWeight     = 0.6;
constexpr double kActivityWeight   = 0.3;
constexpr double kConfidenceWeight = 0.1;

} // namespace

double ConfidenceMultiplier(beacon::model::Confidence confidence) {
  switch (confidence) {
    case beacon::model::Confidence::kGreen:
      return 1.0;
    case beacon::model::Confidence::kYellow:
      return 0.7;
    case beacon::model::Confidence::kRed:
    default:
      return 0.3;
  }
}

std::optional<double> ComputeQualityScore(std::optional<double> uptime_percent, std::optional<std::int64_t> players_current,
                                          std::optional<std::int64_t> players_capacity, beacon::model::Confidence confidence,
                                          std::int64_t default_capacity) {
  if (!uptime_percent) return std::nullopt;

  const double uptime = std::clamp(*uptime_percent, 0.0, 100.0);

  double activity = 0.0;
  if (players_current && players_capacity && *players_capacity > 0) {
    activity = std::clamp(static_cast<double>(*players_current) / static_cast<double>(*players_capacity), 0.0, 1.0) * 100.0;
  } else if (players_current && *players_current > 0 && default_capacity > 0) {
    activity = std::clamp(static_cast<double>(*players_current) / static_cast<double>(default_capacity), 0.0, 1.0) * 100.0;
  }

  const double score = kUptimeWeight * uptime + kActivityWeight * activity + kConfidenceWeight * (100.0 * ConfidenceMultiplier(confidence));
  return std::clamp(score, 0.0, 100.0);
}

} // namespace beacon::engines
