#include "ingest_service.hpp"

#include <stdexcept>

#include "internal/ingest/ingest_gate.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace beacon::service {

using namespace beacon::v1;

namespace {

[[noreturn]] void ThrowRejection(const ingest::AdmitResult& result) {
  const std::string message = std::string(ingest::ToString(*result.reason)) + ": " + result.detail;

  switch (*result.reason) {
    case ingest::RejectionReason::kMalformedPayload:
      throw util::InvalidArgument(message);
    case ingest::RejectionReason::kConsentDenied:
      throw util::PermissionDenied(message);
    case ingest::RejectionReason::kServerNotFound:
      throw util::NotFound(message);
    case ingest::RejectionReason::kMissingPublicKey:
    case ingest::RejectionReason::kInvalidSignature:
      throw util::Unauthenticated(message);
    case ingest::RejectionReason::kKeyVersionMismatch:
      throw util::KeyVersionConflict(message);
    case ingest::RejectionReason::kTimestampStale:
    case ingest::RejectionReason::kTimestampFuture:
    case ingest::RejectionReason::kAgentVersionTooOld:
      throw util::FailedPrecondition(message);
    case ingest::RejectionReason::kHeartbeatIdConflict:
      throw util::IntegrityViolation(message);
  }
  throw std::runtime_error(message);
}

} // namespace

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.gate) {
    throw std::invalid_argument("IngestService: ingest gate is required");
  }
}

beacon::model::HeartbeatEnvelope IngestService::ToEnvelope(const SubmitHeartbeatRequest& req) {
  beacon::model::HeartbeatEnvelope hb;
  hb.server_id    = req.server_id();
  hb.key_version  = req.key_version();
  hb.timestamp    = req.timestamp();
  hb.heartbeat_id = req.heartbeat_id();
  hb.status       = req.status();
  if (req.has_map_name()) hb.map_name = req.map_name();
  if (req.has_players_current()) hb.players_current = req.players_current();
  if (req.has_players_capacity()) hb.players_capacity = req.players_capacity();
  if (req.has_agent_version()) hb.agent_version = req.agent_version();
  hb.signature = req.signature();
  if (req.has_payload()) hb.debug_payload = req.payload();
  hb.extra_fields.insert(req.extra_fields().begin(), req.extra_fields().end());
  return hb;
}

SubmitHeartbeatResponse IngestService::SubmitHeartbeat(const SubmitHeartbeatRequest& req) {
  return ObserveRpc("HeartbeatIngestService.SubmitHeartbeat", req.server_id(), [&] {
    auto result = ctx_.gate->Admit(ToEnvelope(req));
    if (!result.accepted) {
      ThrowRejection(result);
    }

    SubmitHeartbeatResponse resp;
    resp.set_received(true);
    resp.set_server_id(req.server_id());
    resp.set_processed(result.processed);
    resp.set_replay(result.replay);
    return resp;
  });
}

} // namespace beacon::service
