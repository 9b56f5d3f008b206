#include "internal/keys/grace_window.hpp"

#include <algorithm>

namespace beacon::keys {

std::chrono::seconds ResolveGraceWindow(const std::optional<std::int64_t>& cluster_override, const GraceWindowPolicy& policy) {
  const std::int64_t lo = std::min(policy.min_seconds, policy.max_seconds);
  const std::int64_t hi = std::max(policy.min_seconds, policy.max_seconds);
  return std::chrono::seconds(std::clamp(cluster_override.value_or(policy.default_seconds), lo, hi));
}

} // namespace beacon::keys
