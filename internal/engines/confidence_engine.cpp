#include "internal/engines/confidence_engine.hpp"

namespace beacon::engines {

using beacon::model::Confidence;

Confidence ComputeConfidence(const HeartbeatHistory& history, std::chrono::seconds grace, util::TimePoint now) {
  if (history.empty()) return Confidence::kRed;

  const auto age = now - history.front().received_at;
  if (age > 2 * grace) return Confidence::kRed;
  if (history.size() < kMinSamplesForGreen) return Confidence::kYellow;
  if (age <= grace) return Confidence::kGreen;
  return Confidence::kYellow;
}

} // namespace beacon::engines
