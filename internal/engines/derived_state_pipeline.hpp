#pragma once

#include <optional>

#include "internal/engines/anomaly_engine.hpp"
#include "internal/engines/engine_types.hpp"
#include "internal/model/derived_state.hpp"

namespace beacon::engines {

struct EngineOptions {
  std::chrono::hours   uptime_window{24};
  std::chrono::minutes anomaly_decay{30};
  std::int64_t         default_capacity = kDefaultCapacity;
};

struct DerivedState {
  beacon::model::EffectiveStatus effective_status = beacon::model::EffectiveStatus::kUnknown;
  beacon::model::Confidence      confidence       = beacon::model::Confidence::kRed;
  std::optional<double>          uptime_percent;
  std::optional<double>          quality_score;
  AnomalyState                   anomaly;
  std::optional<std::int64_t>    players_current;
  std::optional<std::int64_t>    players_capacity;
  std::optional<util::TimePoint> last_heartbeat_at;
};

// Status -> Confidence -> Uptime -> Anomaly -> Quality for one server at one instant.
// Player counts are taken from the newest heartbeat.
DerivedState ComputeDerivedState(const HeartbeatHistory& history, std::chrono::seconds grace, const AnomalyState& previous_anomaly,
                                 util::TimePoint now, const EngineOptions& options = {});

} // namespace beacon::engines
