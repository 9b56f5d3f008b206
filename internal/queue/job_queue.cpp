#include "internal/queue/job_queue.hpp"

#include <stdexcept>

namespace beacon::queue {
namespace {

void Check(const db::Result& result, const char* op) {
  if (!result) {
    throw std::runtime_error(std::string("job queue ") + op + ": " + result.Describe());
  }
}

} // namespace

JobQueue::JobQueue(std::shared_ptr<db::Repository> repository, Options options, util::ClockFn clock)
    : repository_(std::move(repository)), options_(options), clock_(std::move(clock)) {
  if (!repository_) {
    throw std::invalid_argument("JobQueue: repository is required");
  }
  if (!clock_) {
    clock_ = util::Now;
  }
}

void JobQueue::Enqueue(const std::string& server_id) {
  auto tx = repository_->Begin();
  Enqueue(*tx, server_id);
  tx->Commit();
}

void JobQueue::Enqueue(db::Transaction& tx, const std::string& server_id) {
  Check(repository_->UpsertPendingJob(tx, server_id, util::ToUnixMillis(clock_())), "enqueue");
}

std::vector<db::model::JobRecord> JobQueue::Claim(uint32_t batch_size) {
  if (batch_size == 0) return {};

  const auto ttl_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(options_.claim_ttl).count());

  auto tx   = repository_->Begin();
  auto jobs = repository_->ClaimJobs(*tx, batch_size, util::ToUnixMillis(clock_()), ttl_ms, options_.max_attempts);
  tx->Commit();
  return jobs;
}

bool JobQueue::MarkProcessed(const db::model::JobRecord& job, util::TimePoint at) {
  auto tx     = repository_->Begin();
  auto result = repository_->MarkJobProcessed(*tx, job.id, job.enqueued_at_ms, util::ToUnixMillis(at));
  if (result.code == db::ErrorCode::Conflict) {
    tx->Commit();
    return false;
  }
  Check(result, "mark processed");
  tx->Commit();
  return true;
}

void JobQueue::MarkFailed(uint64_t job_id, const std::string& error, uint32_t attempts) {
  auto tx = repository_->Begin();
  Check(repository_->MarkJobFailed(*tx, job_id, error, attempts), "mark failed");
  tx->Commit();
}

std::optional<db::model::JobRecord> JobQueue::Get(uint64_t job_id) {
  auto tx  = repository_->Begin();
  auto job = repository_->GetJob(*tx, job_id);
  tx->Commit();
  return job;
}

std::vector<db::model::JobRecord> JobQueue::ListForServer(const std::string& server_id) {
  auto tx   = repository_->Begin();
  auto jobs = repository_->ListJobsForServer(*tx, server_id);
  tx->Commit();
  return jobs;
}

} // namespace beacon::queue
