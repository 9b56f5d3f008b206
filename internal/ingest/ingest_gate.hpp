#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "internal/ingest/eligibility.hpp"
#include "internal/keys/grace_window.hpp"
#include "internal/keys/key_material_cache.hpp"
#include "internal/model/heartbeat.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/util/time.hpp"

namespace beacon::ingest {

enum class RejectionReason {
  kMalformedPayload,
  kConsentDenied,
  kServerNotFound,
  kMissingPublicKey,
  kKeyVersionMismatch,
  kInvalidSignature,
  kTimestampStale,
  kTimestampFuture,
  kAgentVersionTooOld,
  kHeartbeatIdConflict,
};

// Stable codes written to the audit trail and metrics.
std::string_view ToString(RejectionReason reason);

struct AdmitResult {
  bool                           accepted  = false;
  bool                           replay    = false;
  bool                           processed = false;
  std::optional<RejectionReason> reason;
  std::string                    detail;
};

struct IngestGateOptions {
  keys::GraceWindowPolicy grace;

  bool                 enforce_timestamp_window = true;
  std::chrono::seconds max_future_skew{60};

  // empty disables the check
  std::string min_agent_version;

  bool record_rejections = true;
};

/*
  IngestGate

  Authenticates one heartbeat and records the outcome. Checks run in a
  fixed order and the first failure wins:

    structure -> eligibility -> key lookup -> key version -> signature
    -> freshness -> agent version -> insert

  The insert is the only replay detection: a duplicate (server_id,
  heartbeat_id) is an accepted replay; a heartbeat_id owned by another
  server is audited and raised as util::IntegrityViolation. Any other
  store failure propagates.

  After a new insert the fast path and the job enqueue run in their own
  transactions; their failures are logged and never fail the request.
*/
class IngestGate {
 public:
  IngestGate(std::shared_ptr<db::Repository> repository, std::shared_ptr<keys::KeyMaterialCache> key_cache,
             std::shared_ptr<queue::JobQueue> jobs, std::shared_ptr<EligibilityPolicy> eligibility, IngestGateOptions options,
             util::ClockFn clock = util::Now);

  // Looks up key material through the cache, refreshing once on a key_version mismatch.
  AdmitResult Admit(const beacon::model::HeartbeatEnvelope& heartbeat);

  // Same checks against caller-supplied key material.
  AdmitResult Admit(const beacon::model::HeartbeatEnvelope& heartbeat, const keys::KeyMaterial& key);

 private:
  std::optional<std::string> ValidateStructure(const beacon::model::HeartbeatEnvelope& heartbeat) const;

  AdmitResult AdmitAuthenticated(const beacon::model::HeartbeatEnvelope& heartbeat, const keys::KeyMaterial& key, util::TimePoint now);
  AdmitResult Insert(const beacon::model::HeartbeatEnvelope& heartbeat, util::TimePoint agent_timestamp, util::TimePoint now);

  bool ApplyFastPath(const beacon::model::HeartbeatEnvelope& heartbeat, util::TimePoint now);
  void EnqueueJob(const std::string& server_id);

  AdmitResult Reject(const beacon::model::HeartbeatEnvelope& heartbeat, RejectionReason reason, std::string detail, util::TimePoint now,
                     bool server_known);
  void        RecordRejection(const beacon::model::HeartbeatEnvelope& heartbeat, RejectionReason reason, const std::string& detail,
                              util::TimePoint now, bool server_known);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<keys::KeyMaterialCache> key_cache_;
  std::shared_ptr<queue::JobQueue>        jobs_;
  std::shared_ptr<EligibilityPolicy>      eligibility_;
  IngestGateOptions                       options_;
  util::ClockFn                           clock_;
};

} // namespace beacon::ingest
