#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace beacon::keys {

struct GraceWindowPolicy {
  std::int64_t default_seconds = 600;
  std::int64_t min_seconds     = 60;
  std::int64_t max_seconds     = 3600;
};

// Cluster override if present, else the default, clamped to [min, max].
std::chrono::seconds ResolveGraceWindow(const std::optional<std::int64_t>& cluster_override, const GraceWindowPolicy& policy);

} // namespace beacon::keys
