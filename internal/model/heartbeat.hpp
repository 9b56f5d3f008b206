#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace beacon::model {

enum class HeartbeatStatus : std::uint8_t {
  kOnline  = 1,
  kOffline = 2,
};

constexpr std::string_view ToString(HeartbeatStatus status) {
  switch (status) {
    case HeartbeatStatus::kOnline:
      return "online";
    case HeartbeatStatus::kOffline:
    default:
      return "offline";
  }
}

constexpr std::optional<HeartbeatStatus> ParseHeartbeatStatus(std::string_view text) {
  if (text == "online") return HeartbeatStatus::kOnline;
  if (text == "offline") return HeartbeatStatus::kOffline;
  return std::nullopt;
}

/*
  Heartbeat as submitted by an agent, before authentication.

  Fields are kept exactly as received so the canonical envelope can be
  rebuilt byte-for-byte; the Ingest Gate validates them.
*/
struct HeartbeatEnvelope {
  std::string  server_id;
  std::int64_t key_version = 0;
  std::string  timestamp;
  std::string  heartbeat_id;
  std::string  status;

  std::optional<std::string>  map_name;
  std::optional<std::int64_t> players_current;
  std::optional<std::int64_t> players_capacity;
  std::optional<std::string>  agent_version;

  std::string signature;

  // never signed
  std::optional<std::string>         debug_payload;
  std::map<std::string, std::string> extra_fields;
};

} // namespace beacon::model
