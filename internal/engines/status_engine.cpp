#include "internal/engines/status_engine.hpp"

namespace beacon::engines {

StatusResult ComputeEffectiveStatus(const HeartbeatHistory& history, std::chrono::seconds grace, util::TimePoint now) {
  if (history.empty()) return {};

  const auto latest = history.front().received_at;
  const auto age    = now - latest;

  StatusResult result;
  result.status            = age <= grace ? beacon::model::EffectiveStatus::kOnline : beacon::model::EffectiveStatus::kOffline;
  result.last_heartbeat_at = latest;
  return result;
}

} // namespace beacon::engines
