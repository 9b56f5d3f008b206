#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace beacon::db::model {

// Audit row for a refused heartbeat. Never carries the signature or player identities.
struct RejectionRecord {
  std::string                id;
  uint64_t                   received_at_ms = 0;
  std::optional<std::string> server_id;
  std::string                rejection_reason;
  std::optional<std::string> agent_version;
  std::string                metadata_json = "{}";
  std::string                event_type    = "server.heartbeat.v1";
};

} // namespace beacon::db::model
