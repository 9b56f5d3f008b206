#include "internal/worker/heartbeat_worker.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace beacon::worker {

using beacon::observability::BoolField;
using beacon::observability::DoubleField;
using beacon::observability::IntField;
using beacon::observability::StringField;

namespace {

engines::HeartbeatHistory ToHistory(const std::vector<db::model::HeartbeatRecord>& rows) {
  engines::HeartbeatHistory history;
  history.reserve(rows.size());
  for (const auto& row : rows) {
    history.push_back(engines::HeartbeatSample{util::FromUnixMillis(row.received_at_ms), row.players_current, row.players_capacity});
  }
  return history;
}

std::optional<uint64_t> ToMillis(const std::optional<util::TimePoint>& tp) {
  if (!tp) return std::nullopt;
  return util::ToUnixMillis(*tp);
}

} // namespace

HeartbeatWorker::HeartbeatWorker(std::shared_ptr<db::Repository> repository, std::shared_ptr<queue::JobQueue> jobs, HeartbeatWorkerOptions options,
                                 util::ClockFn clock)
    : repository_(std::move(repository)), jobs_(std::move(jobs)), options_(options), clock_(std::move(clock)) {
  if (!repository_ || !jobs_) {
    throw std::invalid_argument("HeartbeatWorker: repository and job queue are required");
  }
  if (!clock_) {
    clock_ = util::Now;
  }
}

HeartbeatWorker::~HeartbeatWorker() {
  Stop();
}

void HeartbeatWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&HeartbeatWorker::Run, this);
  BEACON_LOG_INFO("heartbeat worker started", {IntField("batch_size", options_.batch_size),
                                               IntField("poll_interval_ms", options_.poll_interval.count())});
}

void HeartbeatWorker::Stop() {
  {
    std::lock_guard lock(wait_mutex_);
    running_ = false;
  }
  wait_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    BEACON_LOG_INFO("heartbeat worker stopped");
  }
}

bool HeartbeatWorker::WaitFor(std::chrono::milliseconds delay) {
  std::unique_lock lock(wait_mutex_);
  wait_cv_.wait_for(lock, delay, [this] {
    return !running_;
  });
  return running_;
}

void HeartbeatWorker::Run() {
  while (running_) {
    try {
      if (RunOnce() == 0 && !WaitFor(options_.poll_interval)) break;
    } catch (const std::exception& e) {
      BEACON_LOG_ERROR("heartbeat worker poll failed", {StringField("error", e.what())});
      if (!WaitFor(options_.error_backoff)) break;
    }
  }
}

std::size_t HeartbeatWorker::RunOnce() {
  auto claimed = jobs_->Claim(options_.batch_size);
  if (!claimed.empty()) {
    BEACON_LOG_DEBUG("heartbeat jobs claimed", {IntField("count", static_cast<std::int64_t>(claimed.size()))});
  }

  for (const auto& job : claimed) {
    const auto started = std::chrono::steady_clock::now();
    try {
      ProcessJob(job);
    } catch (const std::exception& e) {
      FailJob(job, e.what());
    }
    observability::Metrics::Instance().ObserveJobDurationMs(
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());
  }
  return claimed.size();
}

void HeartbeatWorker::ProcessJob(const db::model::JobRecord& job) {
  // one instant for every engine in this job
  const auto now = clock_();

  auto tx  = repository_->Begin();
  auto key = repository_->GetKeyMaterial(*tx, job.server_id);
  if (!key) {
    tx->Commit();
    FailJob(job, "server or cluster not found");
    return;
  }
  auto rows   = repository_->ListRecentHeartbeats(*tx, job.server_id, options_.history_limit);
  auto server = repository_->GetServer(*tx, job.server_id);
  tx->Commit();

  if (rows.empty() || !server) {
    // nothing to derive from; keep whatever state the server has
    FinishJob(job, "skipped");
    BEACON_LOG_DEBUG("heartbeat job skipped, no heartbeats", {IntField("job_id", static_cast<std::int64_t>(job.id)),
                                                               StringField("server_id", job.server_id)});
    return;
  }

  engines::AnomalyState previous;
  previous.players_spike = server->anomaly_players_spike;
  if (server->anomaly_last_detected_at_ms) {
    previous.last_detected_at = util::FromUnixMillis(*server->anomaly_last_detected_at_ms);
  }

  const auto grace = keys::ResolveGraceWindow(key->heartbeat_grace_seconds, options_.grace);
  const auto state = engines::ComputeDerivedState(ToHistory(rows), grace, previous, now, options_.engines);

  db::model::DerivedStateUpdate update;
  update.server_id                   = job.server_id;
  update.effective_status            = state.effective_status;
  update.confidence                  = state.confidence;
  update.uptime_percent              = state.uptime_percent;
  update.quality_score               = state.quality_score;
  update.anomaly_players_spike       = state.anomaly.players_spike;
  update.anomaly_last_detected_at_ms = ToMillis(state.anomaly.last_detected_at);
  update.players_current             = state.players_current;
  update.players_capacity            = state.players_capacity;
  update.last_heartbeat_at_ms        = ToMillis(state.last_heartbeat_at);
  update.updated_at_ms               = util::ToUnixMillis(now);

  auto write  = repository_->Begin();
  auto result = repository_->ApplyDerivedState(*write, update);
  if (!result) {
    throw std::runtime_error("derived state write failed: " + result.Describe());
  }
  write->Commit();

  FinishJob(job, "processed");

  BEACON_LOG_DEBUG("derived state updated",
                   {StringField("server_id", job.server_id), StringField("status", beacon::model::ToString(state.effective_status)),
                    StringField("confidence", beacon::model::ToString(state.confidence)),
                    DoubleField("uptime_percent", state.uptime_percent.value_or(-1.0)),
                    DoubleField("quality_score", state.quality_score.value_or(-1.0)),
                    BoolField("anomaly_players_spike", state.anomaly.players_spike)});
}

void HeartbeatWorker::FinishJob(const db::model::JobRecord& job, const char* outcome) {
  if (!jobs_->MarkProcessed(job, clock_())) {
    // a heartbeat arrived after the history was read; the job runs again
    observability::Metrics::Instance().RecordJobOutcome("requeued");
    BEACON_LOG_DEBUG("heartbeat job re-enqueued during processing",
                     {IntField("job_id", static_cast<std::int64_t>(job.id)), StringField("server_id", job.server_id)});
    return;
  }
  observability::Metrics::Instance().RecordJobOutcome(outcome);
}

void HeartbeatWorker::FailJob(const db::model::JobRecord& job, const std::string& error) {
  observability::Metrics::Instance().RecordJobOutcome("failed");
  BEACON_LOG_ERROR("heartbeat job failed", {IntField("job_id", static_cast<std::int64_t>(job.id)), StringField("server_id", job.server_id),
                                            IntField("attempts", job.attempts), StringField("error", error)});
  try {
    jobs_->MarkFailed(job.id, error, job.attempts);
  } catch (const std::exception& e) {
    // the claim lease expires and the job is picked up again
    BEACON_LOG_ERROR("heartbeat job mark failed errored", {IntField("job_id", static_cast<std::int64_t>(job.id)), StringField("error", e.what())});
  }
}

} // namespace beacon::worker
