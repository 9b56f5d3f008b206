#include "server_state_service.hpp"

#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/engines/ranking_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace beacon::service {

using namespace beacon::v1;

namespace {

EffectiveStatus StatusToProto(beacon::model::EffectiveStatus status) {
  switch (status) {
    case beacon::model::EffectiveStatus::kOnline:
      return EFFECTIVE_STATUS_ONLINE;
    case beacon::model::EffectiveStatus::kOffline:
      return EFFECTIVE_STATUS_OFFLINE;
    case beacon::model::EffectiveStatus::kUnknown:
    default:
      return EFFECTIVE_STATUS_UNKNOWN;
  }
}

Confidence ConfidenceToProto(beacon::model::Confidence confidence) {
  switch (confidence) {
    case beacon::model::Confidence::kGreen:
      return CONFIDENCE_GREEN;
    case beacon::model::Confidence::kYellow:
      return CONFIDENCE_YELLOW;
    case beacon::model::Confidence::kRed:
    default:
      return CONFIDENCE_RED;
  }
}

void SetTimestamp(const std::optional<uint64_t>& ms, google::protobuf::Timestamp* out) {
  if (ms) *out = util::ToProto(util::FromUnixMillis(*ms));
}

} // namespace

ServerStateService::ServerStateService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.repository) {
    throw std::invalid_argument("ServerStateService: repository is required");
  }
}

ServerState ServerStateService::ToProto(const beacon::db::model::ServerRecord& record, std::int64_t default_capacity) {
  ServerState state;
  state.set_server_id(record.id);
  state.set_cluster_id(record.cluster_id);
  state.set_effective_status(StatusToProto(record.effective_status));
  state.set_confidence(ConfidenceToProto(record.confidence));
  if (record.uptime_percent) state.set_uptime_percent(*record.uptime_percent);
  if (record.quality_score) state.set_quality_score(*record.quality_score);
  state.set_anomaly_players_spike(record.anomaly_players_spike);
  SetTimestamp(record.anomaly_last_detected_at_ms, state.mutable_anomaly_last_detected_at());
  if (record.players_current) state.set_players_current(*record.players_current);
  if (record.players_capacity) state.set_players_capacity(*record.players_capacity);
  SetTimestamp(record.last_heartbeat_at_ms, state.mutable_last_heartbeat_at());
  SetTimestamp(record.last_seen_at_ms, state.mutable_last_seen_at());
  state.set_status_source(record.status_source);
  if (record.updated_at_ms > 0) SetTimestamp(record.updated_at_ms, state.mutable_updated_at());

  engines::RankingInput ranking;
  ranking.quality_score         = record.quality_score;
  ranking.uptime_percent        = record.uptime_percent;
  ranking.players_current       = record.players_current;
  ranking.players_capacity      = record.players_capacity;
  ranking.anomaly_players_spike = record.anomaly_players_spike;
  state.set_ranking_score(engines::ComputeRankingScore(ranking, default_capacity));
  return state;
}

GetServerStateResponse ServerStateService::GetServerState(const GetServerStateRequest& req) {
  return ObserveRpc("ServerStateService.GetServerState", req.server_id(), [&] {
    if (req.server_id().empty()) {
      throw util::InvalidArgument("server_id is required");
    }

    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.repository->GetServer(*tx, req.server_id());
    tx->Commit();
    if (!record) {
      throw util::NotFound("server not registered: " + req.server_id());
    }

    GetServerStateResponse resp;
    *resp.mutable_state() = ToProto(*record, ctx_.default_capacity);
    return resp;
  });
}

} // namespace beacon::service
