#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace beacon::db::model {

/*
  Cluster key material, owned by the administrative side.

  Rotation replaces public_key_ed25519 and increments key_version.
*/
struct ClusterRecord {
  std::string id;

  // base64, 32 raw bytes
  std::optional<std::string> public_key_ed25519;

  std::int64_t key_version = 1;

  // per-cluster override, clamped by the grace policy
  std::optional<std::int64_t> heartbeat_grace_seconds;
};

// Server joined with its cluster's key material.
struct KeyMaterialRecord {
  std::string                 server_id;
  std::string                 cluster_id;
  std::optional<std::string>  public_key_ed25519;
  std::int64_t                key_version = 0;
  std::optional<std::int64_t> heartbeat_grace_seconds;
};

} // namespace beacon::db::model
