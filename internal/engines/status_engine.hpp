#pragma once

#include <optional>

#include "internal/engines/engine_types.hpp"
#include "internal/model/derived_state.hpp"

namespace beacon::engines {

struct StatusResult {
  beacon::model::EffectiveStatus status = beacon::model::EffectiveStatus::kUnknown;
  std::optional<util::TimePoint> last_heartbeat_at;
};

// unknown with no history; online while the latest heartbeat is within grace.
StatusResult ComputeEffectiveStatus(const HeartbeatHistory& history, std::chrono::seconds grace, util::TimePoint now);

} // namespace beacon::engines
