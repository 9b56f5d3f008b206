#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/derived_state.hpp"

namespace beacon::db::model {

/*
  Server registration plus its derived state.

  Registration fields (id, cluster_id) belong to the administrative side.
  Derived fields start as unknown / red / null / null / false.
*/
struct ServerRecord {
  std::string id;
  std::string cluster_id;

  beacon::model::EffectiveStatus effective_status = beacon::model::EffectiveStatus::kUnknown;
  beacon::model::Confidence      confidence       = beacon::model::Confidence::kRed;

  std::optional<double> uptime_percent;
  std::optional<double> quality_score;

  bool                    anomaly_players_spike = false;
  std::optional<uint64_t> anomaly_last_detected_at_ms;

  std::optional<std::int64_t> players_current;
  std::optional<std::int64_t> players_capacity;

  std::optional<uint64_t> last_heartbeat_at_ms;
  std::optional<uint64_t> last_seen_at_ms;

  std::string status_source;
  uint64_t    updated_at_ms = 0;
};

} // namespace beacon::db::model
