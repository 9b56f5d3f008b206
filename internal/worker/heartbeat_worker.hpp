#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/db/api/repository.hpp"
#include "internal/engines/derived_state_pipeline.hpp"
#include "internal/keys/grace_window.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/util/time.hpp"

namespace beacon::worker {

struct HeartbeatWorkerOptions {
  std::chrono::milliseconds poll_interval{5000};
  std::chrono::milliseconds error_backoff{5000};
  uint32_t                  batch_size    = 50;
  uint32_t                  history_limit = 500;

  keys::GraceWindowPolicy grace;
  engines::EngineOptions  engines;
};

/*
  Background consumer of the heartbeat job queue.

  Each poll claims up to batch_size jobs and recomputes derived state for
  their servers one at a time. A failing job is marked failed and left
  pending; the rest of the batch continues. Poll failures are logged and
  retried after error_backoff.
*/
class HeartbeatWorker {
 public:
  HeartbeatWorker(std::shared_ptr<db::Repository> repository, std::shared_ptr<queue::JobQueue> jobs, HeartbeatWorkerOptions options,
                  util::ClockFn clock = util::Now);
  ~HeartbeatWorker();

  HeartbeatWorker(const HeartbeatWorker&)            = delete;
  HeartbeatWorker& operator=(const HeartbeatWorker&) = delete;

  void Start();
  void Stop();

  bool IsRunning() const {
    return running_;
  }

  // One synchronous poll. Returns the number of jobs claimed.
  std::size_t RunOnce();

 private:
  void Run();
  void ProcessJob(const db::model::JobRecord& job);
  void FinishJob(const db::model::JobRecord& job, const char* outcome);
  void FailJob(const db::model::JobRecord& job, const std::string& error);

  // False when Stop() interrupted the wait.
  bool WaitFor(std::chrono::milliseconds delay);

  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<queue::JobQueue> jobs_;
  HeartbeatWorkerOptions           options_;
  util::ClockFn                    clock_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
};

} // namespace beacon::worker
