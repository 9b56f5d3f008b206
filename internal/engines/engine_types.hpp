#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "internal/util/time.hpp"

namespace beacon::engines {

/*
  Engine inputs.

  Engines are pure: every function takes the evaluation instant `now`
  explicitly and never reads a clock. History is ordered newest first by
  received_at (the server clock); the agent timestamp never reaches here.
*/

struct HeartbeatSample {
  util::TimePoint             received_at;
  std::optional<std::int64_t> players_current;
  std::optional<std::int64_t> players_capacity;
};

using HeartbeatHistory = std::vector<HeartbeatSample>;

inline constexpr std::int64_t kDefaultCapacity = 70;

} // namespace beacon::engines
