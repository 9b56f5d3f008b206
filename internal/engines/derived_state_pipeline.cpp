#include "internal/engines/derived_state_pipeline.hpp"

#include "internal/engines/confidence_engine.hpp"
#include "internal/engines/quality_engine.hpp"
#include "internal/engines/status_engine.hpp"
#include "internal/engines/uptime_engine.hpp"

namespace beacon::engines {

DerivedState ComputeDerivedState(const HeartbeatHistory& history, std::chrono::seconds grace, const AnomalyState& previous_anomaly,
                                 util::TimePoint now, const EngineOptions& options) {
  DerivedState out;

  auto status           = ComputeEffectiveStatus(history, grace, now);
  out.effective_status  = status.status;
  out.last_heartbeat_at = status.last_heartbeat_at;

  out.confidence     = ComputeConfidence(history, grace, now);
  out.uptime_percent = ComputeUptimePercent(history, grace, now, options.uptime_window);
  out.anomaly        = DetectPlayerSpike(history, previous_anomaly, now, AnomalyOptions{options.anomaly_decay, options.default_capacity});

  if (!history.empty()) {
    out.players_current  = history.front().players_current;
    out.players_capacity = history.front().players_capacity;
  }

  out.quality_score = ComputeQualityScore(out.uptime_percent, out.players_current, out.players_capacity, out.confidence, options.default_capacity);
  return out;
}

} // namespace beacon::engines
