#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/heartbeat.hpp"

namespace beacon::db::model {

/*
  Append-only authenticated heartbeat.

  Unique on (server_id, heartbeat_id); heartbeat_id is also globally unique.
*/
struct HeartbeatRecord {
  std::string id;
  std::string server_id;
  std::string heartbeat_id;

  std::int64_t key_version = 0;

  // agent clock, informational only
  uint64_t agent_timestamp_ms = 0;

  // server clock, the only time the engines trust
  uint64_t received_at_ms = 0;

  beacon::model::HeartbeatStatus status = beacon::model::HeartbeatStatus::kOnline;

  std::optional<std::string>  map_name;
  std::optional<std::int64_t> players_current;
  std::optional<std::int64_t> players_capacity;
  std::optional<std::string>  agent_version;

  std::string                signature;
  std::optional<std::string> debug_payload;
};

} // namespace beacon::db::model
