#include "internal/engines/uptime_engine.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace beacon::engines {

std::optional<double> ComputeUptimePercent(const HeartbeatHistory& history, std::chrono::seconds grace, util::TimePoint now,
                                           std::chrono::hours window) {
  if (window <= std::chrono::hours::zero()) return std::nullopt;

  const auto window_start = now - window;

  std::vector<std::pair<util::TimePoint, util::TimePoint>> intervals;
  intervals.reserve(history.size());
  for (const auto& hb : history) {
    if (hb.received_at < window_start || hb.received_at > now) continue;
    intervals.emplace_back(hb.received_at, std::min(hb.received_at + grace, now));
  }
  if (intervals.empty()) return std::nullopt;

  std::sort(intervals.begin(), intervals.end());

  util::Clock::duration covered{0};
  auto                  current = intervals.front();
  for (std::size_t i = 1; i < intervals.size(); ++i) {
    const auto& next = intervals[i];
    if (next.first <= current.second) {
      current.second = std::max(current.second, next.second);
      continue;
    }
    covered += current.second - current.first;
    current = next;
  }
  covered += current.second - current.first;

  const double percent = 100.0 * std::chrono::duration<double>(covered).count() / std::chrono::duration<double>(window).count();
  return std::clamp(percent, 0.0, 100.0);
}

} // namespace beacon::engines
