#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace beacon::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // CREATE ... IF NOT EXISTS for every table and index.
  static void Bootstrap(SqliteDB& db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace beacon::db::sqlite
