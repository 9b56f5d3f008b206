#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/derived_state.hpp"

namespace beacon::db::model {

/*
  Ingest fast path. Touches last_seen_at, player counts and status_source
  only; never effective_status or any other worker-owned field.
*/
struct FastPathUpdate {
  std::string                 server_id;
  uint64_t                    last_seen_at_ms = 0;
  std::optional<std::int64_t> players_current;
  std::optional<std::int64_t> players_capacity;
  std::string                 status_source = "agent";
};

/*
  Worker write. Replaces every derived field of one server at once.
*/
struct DerivedStateUpdate {
  std::string server_id;

  beacon::model::EffectiveStatus effective_status = beacon::model::EffectiveStatus::kUnknown;
  beacon::model::Confidence      confidence       = beacon::model::Confidence::kRed;

  std::optional<double> uptime_percent;
  std::optional<double> quality_score;

  bool                    anomaly_players_spike = false;
  std::optional<uint64_t> anomaly_last_detected_at_ms;

  std::optional<std::int64_t> players_current;
  std::optional<std::int64_t> players_capacity;
  std::optional<uint64_t>     last_heartbeat_at_ms;

  uint64_t updated_at_ms = 0;
};

} // namespace beacon::db::model
