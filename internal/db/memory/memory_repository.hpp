#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace beacon::db::memory {

class MemoryTransaction;

/*
  Deterministic in-process backend used by tests and single-node runs.

  One transaction at a time: Begin() blocks until the previous transaction
  commits or rolls back, so every transaction is serializable.
  Never Begin() twice on the same thread without finishing the first.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertCluster(Transaction&, const model::ClusterRecord&) override;
  std::optional<model::ClusterRecord> GetCluster(Transaction&, const std::string&) override;
  Result InsertServer(Transaction&, const model::ServerRecord&) override;
  std::optional<model::ServerRecord> GetServer(Transaction&, const std::string&) override;
  std::optional<model::KeyMaterialRecord> GetKeyMaterial(Transaction&, const std::string&) override;

  Result InsertHeartbeat(Transaction&, const model::HeartbeatRecord&) override;
  std::optional<model::HeartbeatRecord> GetHeartbeat(Transaction&, const std::string& server_id, const std::string& heartbeat_id) override;
  std::vector<model::HeartbeatRecord> ListRecentHeartbeats(Transaction&, const std::string& server_id, uint32_t limit) override;

  Result ApplyFastPath(Transaction&, const model::FastPathUpdate&) override;
  Result ApplyDerivedState(Transaction&, const model::DerivedStateUpdate&) override;

  Result UpsertPendingJob(Transaction&, const std::string& server_id, uint64_t now_ms) override;
  std::vector<model::JobRecord> ClaimJobs(Transaction&, uint32_t batch_size, uint64_t now_ms, uint64_t claim_ttl_ms,
                                          uint32_t max_attempts) override;
  Result MarkJobProcessed(Transaction&, uint64_t job_id, uint64_t claimed_enqueued_at_ms, uint64_t processed_at_ms) override;
  Result MarkJobFailed(Transaction&, uint64_t job_id, const std::string& error, uint32_t attempts) override;
  std::optional<model::JobRecord> GetJob(Transaction&, uint64_t job_id) override;
  std::vector<model::JobRecord> ListJobsForServer(Transaction&, const std::string& server_id) override;

  Result InsertRejection(Transaction&, const model::RejectionRecord&) override;
  std::vector<model::RejectionRecord> ListRejections(Transaction&, uint32_t limit) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ClusterRecord> clusters;
    std::unordered_map<std::string, model::ServerRecord>  servers;

    // per server, in insertion order
    std::unordered_map<std::string, std::vector<model::HeartbeatRecord>> heartbeats;
    // heartbeat_id -> owning server_id
    std::unordered_map<std::string, std::string> heartbeat_owner;

    std::map<uint64_t, model::JobRecord> jobs;
    uint64_t                             next_job_id = 1;

    std::vector<model::RejectionRecord> rejections;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace beacon::db::memory
