#include "internal/engines/anomaly_engine.hpp"

namespace beacon::engines {
namespace {

constexpr std::int64_t kSpikePeak        = 50;
constexpr std::int64_t kDropPeak         = 30;
constexpr double       kSpikeWindowSec   = 60.0;
constexpr double       kDropWindowSec    = 10.0;
constexpr double       kJumpCapacityFrac = 0.5;

double SecondsBetween(util::TimePoint earlier, util::TimePoint later) {
  return std::chrono::duration<double>(later - earlier).count();
}

// Newest matching triple's received_at, if any.
std::optional<util::TimePoint> FindNewestSpike(const HeartbeatHistory& history, std::int64_t default_capacity) {
  for (std::size_t i = 0; i + 2 < history.size(); ++i) {
    const auto& newest = history[i];
    const auto& middle = history[i + 1];
    const auto& oldest = history[i + 2];
    if (!newest.players_current || !middle.players_current || !oldest.players_current) continue;

    const std::int64_t p_new = *newest.players_current;
    const std::int64_t p_mid = *middle.players_current;
    const std::int64_t p_old = *oldest.players_current;

    const double mid_to_new = SecondsBetween(middle.received_at, newest.received_at);
    const double total      = SecondsBetween(oldest.received_at, newest.received_at);

    if (p_old == 0 && p_mid >= kSpikePeak && p_new == 0 && total < kSpikeWindowSec) {
      return newest.received_at;
    }

    if (p_mid > 0 && p_new > p_mid) {
      const std::int64_t capacity = newest.players_capacity.value_or(0) > 0 ? *newest.players_capacity : default_capacity;
      const double       jump     = static_cast<double>(p_new - p_mid) / static_cast<double>(capacity);
      if (jump > kJumpCapacityFrac && mid_to_new < kSpikeWindowSec) {
        return newest.received_at;
      }
    }

    if (p_mid >= kDropPeak && p_new == 0 && mid_to_new < kDropWindowSec) {
      return newest.received_at;
    }
  }
  return std::nullopt;
}

} // namespace

AnomalyState DetectPlayerSpike(const HeartbeatHistory& history, const AnomalyState& previous, util::TimePoint now,
                               const AnomalyOptions& options) {
  const std::int64_t capacity = options.default_capacity > 0 ? options.default_capacity : kDefaultCapacity;

  if (auto detected = FindNewestSpike(history, capacity); detected && *detected + options.decay > now) {
    return AnomalyState{true, detected};
  }

  if (!previous.players_spike) return AnomalyState{};

  if (previous.last_detected_at && now >= *previous.last_detected_at + options.decay) {
    return AnomalyState{};
  }
  return previous;
}

} // namespace beacon::engines
