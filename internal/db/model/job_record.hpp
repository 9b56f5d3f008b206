#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace beacon::db::model {

/*
  Derived-state recompute job.

  Pending iff processed_at_ms is unset; at most one pending job per server.
  claimed_at_ms marks a live lease held by a worker.
*/
struct JobRecord {
  uint64_t    id = 0;
  std::string server_id;

  uint64_t                enqueued_at_ms = 0;
  std::optional<uint64_t> claimed_at_ms;
  std::optional<uint64_t> processed_at_ms;

  uint32_t                   attempts = 0;
  std::optional<std::string> last_error;
};

} // namespace beacon::db::model
