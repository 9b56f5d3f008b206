#pragma once

#include <optional>

#include "internal/engines/engine_types.hpp"

namespace beacon::engines {

struct AnomalyState {
  bool                           players_spike = false;
  std::optional<util::TimePoint> last_detected_at;
};

struct AnomalyOptions {
  std::chrono::minutes decay{30};
  std::int64_t         default_capacity = kDefaultCapacity;
};

/*
  Player-spike detector.

  Walks consecutive (newest, middle, oldest) triples, skipping any with an
  unknown player count, and looks for:

    a) 0 -> >=50 -> 0 with less than 60s between oldest and newest
    b) middle > 0 and newest - middle above half of capacity within 60s
    c) >=30 -> 0 within 10s

  The newest match triggers while detected_at + decay > now. Without a
  trigger the previous flag is held until last_detected_at + decay, then
  cleared together with its timestamp.
*/
AnomalyState DetectPlayerSpike(const HeartbeatHistory& history, const AnomalyState& previous, util::TimePoint now,
                               const AnomalyOptions& options = {});

} // namespace beacon::engines
