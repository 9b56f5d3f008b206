#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cluster_record.hpp"
#include "internal/db/model/derived_state_update.hpp"
#include "internal/db/model/heartbeat_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/rejection_record.hpp"
#include "internal/db/model/server_record.hpp"

namespace beacon::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - InsertHeartbeat is a single atomic insert-or-conflict; it is the only
    replay detection in the system
  - At most one pending job exists per server
  - Fast-path and derived-state writes touch disjoint column sets

  The DB is the source of truth for:
    heartbeat history
    job queue
    derived server state
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Registry (written by the administrative side, read here)
  // ---------------------------------------------------------------------

  virtual Result UpsertCluster(Transaction&, const model::ClusterRecord&) = 0;

  virtual std::optional<model::ClusterRecord> GetCluster(Transaction&, const std::string& cluster_id) = 0;

  // Registers a server with the initial derived state.
  virtual Result InsertServer(Transaction&, const model::ServerRecord&) = 0;

  virtual std::optional<model::ServerRecord> GetServer(Transaction&, const std::string& server_id) = 0;

  // Server joined with its cluster; nullopt when either is missing.
  virtual std::optional<model::KeyMaterialRecord> GetKeyMaterial(Transaction&, const std::string& server_id) = 0;

  // ---------------------------------------------------------------------
  // Heartbeats (append-only)
  // ---------------------------------------------------------------------

  // OK, AlreadyExists (replay) or Conflict (heartbeat_id owned by another server).
  virtual Result InsertHeartbeat(Transaction&, const model::HeartbeatRecord&) = 0;

  virtual std::optional<model::HeartbeatRecord> GetHeartbeat(Transaction&, const std::string& server_id, const std::string& heartbeat_id) = 0;

  // Newest first by received_at.
  virtual std::vector<model::HeartbeatRecord> ListRecentHeartbeats(Transaction&, const std::string& server_id, uint32_t limit) = 0;

  // ---------------------------------------------------------------------
  // Derived state
  // ---------------------------------------------------------------------

  virtual Result ApplyFastPath(Transaction&, const model::FastPathUpdate&) = 0;

  virtual Result ApplyDerivedState(Transaction&, const model::DerivedStateUpdate&) = 0;

  // ---------------------------------------------------------------------
  // Job queue
  // ---------------------------------------------------------------------

  // Refreshes enqueued_at of the pending job for server_id or inserts one.
  // A refresh always moves enqueued_at forward, by at least 1ms.
  virtual Result UpsertPendingJob(Transaction&, const std::string& server_id, uint64_t now_ms) = 0;

  // Pending jobs ordered by enqueued_at whose claim is absent or older than
  // claim_ttl_ms. Claiming stamps claimed_at and increments attempts.
  // max_attempts == 0 means no ceiling.
  virtual std::vector<model::JobRecord> ClaimJobs(Transaction&, uint32_t batch_size, uint64_t now_ms, uint64_t claim_ttl_ms,
                                                  uint32_t max_attempts) = 0;

  // Finishes the job only if enqueued_at still equals claimed_enqueued_at_ms.
  // A job refreshed after it was claimed stays pending with its claim and
  // attempts cleared, and the call returns Conflict.
  virtual Result MarkJobProcessed(Transaction&, uint64_t job_id, uint64_t claimed_enqueued_at_ms, uint64_t processed_at_ms) = 0;

  virtual Result MarkJobFailed(Transaction&, uint64_t job_id, const std::string& error, uint32_t attempts) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, uint64_t job_id) = 0;

  // Ordered by id.
  virtual std::vector<model::JobRecord> ListJobsForServer(Transaction&, const std::string& server_id) = 0;

  // ---------------------------------------------------------------------
  // Rejection audit
  // ---------------------------------------------------------------------

  virtual Result InsertRejection(Transaction&, const model::RejectionRecord&) = 0;

  // Newest first.
  virtual std::vector<model::RejectionRecord> ListRejections(Transaction&, uint32_t limit) = 0;
};

} // namespace beacon::db
