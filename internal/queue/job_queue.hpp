#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace beacon::queue {

/*
  Durable job queue over db::Repository.

  At-least-once: a job is pending until MarkProcessed. A job refreshed by
  Enqueue after it was claimed is not finished; MarkProcessed releases it
  for the next Claim instead. Each operation runs in its own transaction
  unless the caller passes one in.
  Non-OK repository results are raised as std::runtime_error.
*/
class JobQueue {
 public:
  struct Options {
    std::chrono::seconds claim_ttl{120};
    // 0 means unlimited
    uint32_t max_attempts = 0;
  };

  JobQueue(std::shared_ptr<db::Repository> repository, Options options, util::ClockFn clock = util::Now);

  // Inserts a pending job for server_id or refreshes the existing one's enqueued_at.
  void Enqueue(const std::string& server_id);
  void Enqueue(db::Transaction& tx, const std::string& server_id);

  std::vector<db::model::JobRecord> Claim(uint32_t batch_size);

  // Returns false when the job was re-enqueued after `job` was claimed.
  bool MarkProcessed(const db::model::JobRecord& job, util::TimePoint at);
  void MarkFailed(uint64_t job_id, const std::string& error, uint32_t attempts);

  std::optional<db::model::JobRecord> Get(uint64_t job_id);
  std::vector<db::model::JobRecord>   ListForServer(const std::string& server_id);

  const Options& options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  Options                         options_;
  util::ClockFn                   clock_;
};

} // namespace beacon::queue
