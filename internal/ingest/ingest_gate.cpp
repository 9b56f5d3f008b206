#include "internal/ingest/ingest_gate.hpp"

#include <stdexcept>

#include "internal/crypto/canonical_envelope.hpp"
#include "internal/ingest/agent_version.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace beacon::ingest {

using beacon::observability::StringField;

std::string_view ToString(RejectionReason reason) {
  switch (reason) {
    case RejectionReason::kMalformedPayload:
      return "malformed_payload";
    case RejectionReason::kConsentDenied:
      return "consent_denied";
    case RejectionReason::kServerNotFound:
      return "server_not_found";
    case RejectionReason::kMissingPublicKey:
      return "missing_public_key";
    case RejectionReason::kKeyVersionMismatch:
      return "key_version_mismatch";
    case RejectionReason::kInvalidSignature:
      return "invalid_signature";
    case RejectionReason::kTimestampStale:
      return "timestamp_stale";
    case RejectionReason::kTimestampFuture:
      return "timestamp_future";
    case RejectionReason::kAgentVersionTooOld:
      return "agent_version_too_old";
    case RejectionReason::kHeartbeatIdConflict:
      return "heartbeat_id_conflict";
  }
  return "unknown";
}

IngestGate::IngestGate(std::shared_ptr<db::Repository> repository, std::shared_ptr<keys::KeyMaterialCache> key_cache,
                       std::shared_ptr<queue::JobQueue> jobs, std::shared_ptr<EligibilityPolicy> eligibility, IngestGateOptions options,
                       util::ClockFn clock)
    : repository_(std::move(repository)),
      key_cache_(std::move(key_cache)),
      jobs_(std::move(jobs)),
      eligibility_(std::move(eligibility)),
      options_(std::move(options)),
      clock_(std::move(clock)) {
  if (!repository_ || !key_cache_ || !jobs_) {
    throw std::invalid_argument("IngestGate: repository, key cache and job queue are required");
  }
  if (!eligibility_) {
    eligibility_ = std::make_shared<AllowAllPolicy>();
  }
  if (!clock_) {
    clock_ = util::Now;
  }
}

std::optional<std::string> IngestGate::ValidateStructure(const beacon::model::HeartbeatEnvelope& hb) const {
  if (hb.server_id.empty()) return "server_id is required";
  if (hb.heartbeat_id.empty()) return "heartbeat_id is required";
  if (hb.signature.empty()) return "signature is required";
  if (hb.key_version < 1) return "key_version must be >= 1";
  if (!util::ParseRfc3339(hb.timestamp)) return "timestamp is not RFC3339";
  if (!beacon::model::ParseHeartbeatStatus(hb.status)) return "status must be online or offline";
  if (hb.players_current && *hb.players_current < 0) return "players_current must be >= 0";
  if (hb.players_capacity && *hb.players_capacity < 0) return "players_capacity must be >= 0";
  return std::nullopt;
}

AdmitResult IngestGate::Admit(const beacon::model::HeartbeatEnvelope& hb) {
  const auto now = clock_();

  if (auto problem = ValidateStructure(hb)) {
    return Reject(hb, RejectionReason::kMalformedPayload, *problem, now, false);
  }
  if (!eligibility_->Allowed(hb.server_id, "heartbeat", {})) {
    return Reject(hb, RejectionReason::kConsentDenied, "server has not consented to heartbeat ingestion", now, false);
  }

  auto key = key_cache_->Get(hb.server_id);
  if (key && key->key_version != hb.key_version) {
    // picks up a rotation that happened inside the cache TTL
    key = key_cache_->Refresh(hb.server_id);
  }
  if (!key) {
    return Reject(hb, RejectionReason::kServerNotFound, "server not registered", now, false);
  }

  return AdmitAuthenticated(hb, *key, now);
}

AdmitResult IngestGate::Admit(const beacon::model::HeartbeatEnvelope& hb, const keys::KeyMaterial& key) {
  const auto now = clock_();

  if (auto problem = ValidateStructure(hb)) {
    return Reject(hb, RejectionReason::kMalformedPayload, *problem, now, false);
  }
  if (!eligibility_->Allowed(hb.server_id, "heartbeat", {})) {
    return Reject(hb, RejectionReason::kConsentDenied, "server has not consented to heartbeat ingestion", now, false);
  }
  return AdmitAuthenticated(hb, key, now);
}

AdmitResult IngestGate::AdmitAuthenticated(const beacon::model::HeartbeatEnvelope& hb, const keys::KeyMaterial& key, util::TimePoint now) {
  if (!key.public_key_b64 || key.public_key_b64->empty()) {
    return Reject(hb, RejectionReason::kMissingPublicKey, "cluster has no public key", now, true);
  }

  if (hb.key_version != key.key_version) {
    return Reject(hb, RejectionReason::kKeyVersionMismatch,
                  "expected key_version " + std::to_string(key.key_version) + ", got " + std::to_string(hb.key_version), now, true);
  }

  if (!crypto::VerifyHeartbeatSignature(hb, *key.public_key_b64)) {
    return Reject(hb, RejectionReason::kInvalidSignature, "signature does not verify", now, true);
  }

  const auto agent_timestamp = *util::ParseRfc3339(hb.timestamp);
  if (options_.enforce_timestamp_window) {
    const auto grace = keys::ResolveGraceWindow(key.grace_seconds, options_.grace);
    if (now - agent_timestamp > grace) {
      return Reject(hb, RejectionReason::kTimestampStale, "timestamp older than " + std::to_string(grace.count()) + "s", now, true);
    }
    if (agent_timestamp - now > options_.max_future_skew) {
      return Reject(hb, RejectionReason::kTimestampFuture,
                    "timestamp more than " + std::to_string(options_.max_future_skew.count()) + "s in the future", now, true);
    }
  }

  if (!options_.min_agent_version.empty() && !IsVersionAtLeast(hb.agent_version.value_or(""), options_.min_agent_version)) {
    return Reject(hb, RejectionReason::kAgentVersionTooOld, "agent_version below " + options_.min_agent_version, now, true);
  }

  return Insert(hb, agent_timestamp, now);
}

AdmitResult IngestGate::Insert(const beacon::model::HeartbeatEnvelope& hb, util::TimePoint agent_timestamp, util::TimePoint now) {
  db::model::HeartbeatRecord record;
  record.id                 = util::NewUuidString();
  record.server_id          = hb.server_id;
  record.heartbeat_id       = hb.heartbeat_id;
  record.key_version        = hb.key_version;
  record.agent_timestamp_ms = util::ToUnixMillis(agent_timestamp);
  record.received_at_ms     = util::ToUnixMillis(now);
  record.status             = *beacon::model::ParseHeartbeatStatus(hb.status);
  record.map_name           = hb.map_name;
  record.players_current    = hb.players_current;
  record.players_capacity   = hb.players_capacity;
  record.agent_version      = hb.agent_version;
  record.signature          = hb.signature;
  record.debug_payload      = hb.debug_payload;

  auto tx     = repository_->Begin();
  auto result = repository_->InsertHeartbeat(*tx, record);

  if (result.code == db::ErrorCode::AlreadyExists) {
    tx->Rollback();
    BEACON_LOG_INFO("heartbeat replay", {StringField("server_id", hb.server_id), StringField("heartbeat_id", hb.heartbeat_id)});
    observability::Metrics::Instance().RecordHeartbeatOutcome("replay");
    return AdmitResult{true, true, true, std::nullopt, {}};
  }

  if (result.code == db::ErrorCode::Conflict) {
    tx->Rollback();
    BEACON_LOG_ERROR("heartbeat_id reused across servers",
                     {StringField("server_id", hb.server_id), StringField("heartbeat_id", hb.heartbeat_id)});
    RecordRejection(hb, RejectionReason::kHeartbeatIdConflict, "heartbeat_id owned by another server", now, true);
    observability::Metrics::Instance().RecordHeartbeatOutcome(ToString(RejectionReason::kHeartbeatIdConflict));
    throw util::IntegrityViolation("heartbeat_id " + hb.heartbeat_id + " already recorded for another server");
  }

  if (!result) {
    tx->Rollback();
    throw std::runtime_error("heartbeat insert failed: " + result.Describe());
  }
  tx->Commit();

  const bool processed = ApplyFastPath(hb, now);
  EnqueueJob(hb.server_id);

  BEACON_LOG_DEBUG("heartbeat accepted",
                   {StringField("server_id", hb.server_id), StringField("heartbeat_id", hb.heartbeat_id), StringField("status", hb.status)});
  observability::Metrics::Instance().RecordHeartbeatOutcome("accepted");
  return AdmitResult{true, false, processed, std::nullopt, {}};
}

bool IngestGate::ApplyFastPath(const beacon::model::HeartbeatEnvelope& hb, util::TimePoint now) {
  db::model::FastPathUpdate update;
  update.server_id        = hb.server_id;
  update.last_seen_at_ms  = util::ToUnixMillis(now);
  update.players_current  = hb.players_current;
  update.players_capacity = hb.players_capacity;

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->ApplyFastPath(*tx, update);
    if (!result) {
      BEACON_LOG_WARN("heartbeat fast path failed", {StringField("server_id", hb.server_id), StringField("error", result.Describe())});
      return false;
    }
    tx->Commit();
    return true;
  } catch (const std::exception& e) {
    BEACON_LOG_WARN("heartbeat fast path failed", {StringField("server_id", hb.server_id), StringField("error", e.what())});
    return false;
  }
}

void IngestGate::EnqueueJob(const std::string& server_id) {
  try {
    jobs_->Enqueue(server_id);
  } catch (const std::exception& e) {
    // heartbeat is durable; the next accepted heartbeat re-enqueues
    BEACON_LOG_ERROR("heartbeat job enqueue failed", {StringField("server_id", server_id), StringField("error", e.what())});
  }
}

AdmitResult IngestGate::Reject(const beacon::model::HeartbeatEnvelope& hb, RejectionReason reason, std::string detail, util::TimePoint now,
                               bool server_known) {
  BEACON_LOG_WARN("heartbeat rejected", {StringField("reason", ToString(reason)), StringField("server_id", hb.server_id),
                                         StringField("detail", detail)});
  RecordRejection(hb, reason, detail, now, server_known);
  observability::Metrics::Instance().RecordHeartbeatOutcome(ToString(reason));

  AdmitResult result;
  result.reason = reason;
  result.detail = std::move(detail);
  return result;
}

void IngestGate::RecordRejection(const beacon::model::HeartbeatEnvelope& hb, RejectionReason reason, const std::string& detail,
                                 util::TimePoint now, bool server_known) {
  if (!options_.record_rejections) return;

  db::model::RejectionRecord record;
  record.id               = util::NewUuidString();
  record.received_at_ms   = util::ToUnixMillis(now);
  record.rejection_reason = std::string(ToString(reason));
  record.agent_version    = hb.agent_version;
  // server_id is only stored once it is known to reference a registered server
  if (server_known) record.server_id = hb.server_id;
  record.metadata_json = "{\"detail\":" + crypto::JsonQuote(detail) + ",\"heartbeat_id\":" + crypto::JsonQuote(hb.heartbeat_id) +
                         ",\"key_version\":" + std::to_string(hb.key_version) + "}";

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertRejection(*tx, record);
    if (!result) {
      BEACON_LOG_WARN("rejection audit write failed", {StringField("reason", ToString(reason)), StringField("error", result.Describe())});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    BEACON_LOG_WARN("rejection audit write failed", {StringField("reason", ToString(reason)), StringField("error", e.what())});
  }
}

} // namespace beacon::ingest
