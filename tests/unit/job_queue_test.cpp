#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/job_queue.hpp"
#include "tests/support/beacon_test_support.hpp"

namespace {

using namespace std::chrono_literals;
using beacon::queue::JobQueue;
using beacon::testing::ManualClock;

struct Fixture {
  ManualClock                                           clock;
  std::shared_ptr<beacon::db::memory::MemoryRepository> repo = std::make_shared<beacon::db::memory::MemoryRepository>();

  JobQueue Queue(std::chrono::seconds claim_ttl = 120s, uint32_t max_attempts = 0) {
    return JobQueue(repo, {claim_ttl, max_attempts}, clock.Fn());
  }
};

void TestOnePendingJobPerServer() {
  Fixture f;
  auto    q = f.Queue();

  q.Enqueue("srv-1");
  f.clock.Advance(5s);
  q.Enqueue("srv-1");

  auto jobs = q.ListForServer("srv-1");
  assert(jobs.size() == 1);
  assert(jobs[0].enqueued_at_ms == beacon::util::ToUnixMillis(f.clock.Now()));
  assert(!jobs[0].processed_at_ms.has_value());
}

void TestProcessedJobAllowsNewOne() {
  Fixture f;
  auto    q = f.Queue();

  q.Enqueue("srv-1");
  auto claimed = q.Claim(10);
  assert(claimed.size() == 1);
  assert(q.MarkProcessed(claimed[0], f.clock.Now()));

  q.Enqueue("srv-1");
  auto jobs = q.ListForServer("srv-1");
  assert(jobs.size() == 2);
  assert(jobs[0].processed_at_ms.has_value());
  assert(!jobs[1].processed_at_ms.has_value());
}

void TestEnqueueWhileClaimedKeepsJobPending() {
  Fixture f;
  auto    q = f.Queue();

  q.Enqueue("srv-1");
  auto job = q.Claim(10).at(0);

  // second heartbeat lands after the worker read the history
  f.clock.Advance(1s);
  q.Enqueue("srv-1");

  assert(!q.MarkProcessed(job, f.clock.Now()));

  auto jobs = q.ListForServer("srv-1");
  assert(jobs.size() == 1);
  assert(jobs[0].id == job.id);
  assert(!jobs[0].processed_at_ms.has_value());
  assert(!jobs[0].claimed_at_ms.has_value());
  assert(jobs[0].attempts == 0);

  // released without waiting for the lease
  f.clock.Advance(300s);
  auto again = q.Claim(10);
  assert(again.size() == 1);
  assert(again[0].id == job.id);
  assert(again[0].attempts == 1);
  assert(q.MarkProcessed(again[0], f.clock.Now()));
  assert(q.Get(job.id)->processed_at_ms.has_value());
  assert(q.Claim(10).empty());
}

void TestEnqueueInSameMillisecondAsClaimIsNotLost() {
  Fixture f;
  auto    q = f.Queue();

  q.Enqueue("srv-1");
  auto job = q.Claim(10).at(0);
  q.Enqueue("srv-1");

  assert(q.Get(job.id)->enqueued_at_ms == job.enqueued_at_ms + 1);
  assert(!q.MarkProcessed(job, f.clock.Now()));
  assert(q.Claim(10).size() == 1);
}

void TestClaimOrdersByEnqueueTime() {
  Fixture f;
  auto    q = f.Queue();

  q.Enqueue("srv-a");
  f.clock.Advance(1s);
  q.Enqueue("srv-b");
  f.clock.Advance(1s);
  q.Enqueue("srv-c");
  f.clock.Advance(1s);
  // refresh moves srv-a to the back
  q.Enqueue("srv-a");

  auto claimed = q.Claim(2);
  assert(claimed.size() == 2);
  assert(claimed[0].server_id == "srv-b");
  assert(claimed[1].server_id == "srv-c");
  assert(claimed[0].attempts == 1);
  assert(claimed[0].claimed_at_ms == beacon::util::ToUnixMillis(f.clock.Now()));

  auto rest = q.Claim(10);
  assert(rest.size() == 1);
  assert(rest[0].server_id == "srv-a");
}

void TestClaimLeaseExpires() {
  Fixture f;
  auto    q = f.Queue(120s);

  q.Enqueue("srv-1");
  assert(q.Claim(10).size() == 1);
  assert(q.Claim(10).empty());

  f.clock.Advance(120s);
  assert(q.Claim(10).empty());

  f.clock.Advance(1s);
  auto reclaimed = q.Claim(10);
  assert(reclaimed.size() == 1);
  assert(reclaimed[0].attempts == 2);
}

void TestMarkFailedReleasesClaim() {
  Fixture f;
  auto    q = f.Queue();

  q.Enqueue("srv-1");
  auto job = q.Claim(10).at(0);
  q.MarkFailed(job.id, "boom", job.attempts);

  auto stored = q.Get(job.id);
  assert(stored.has_value());
  assert(stored->last_error == "boom");
  assert(stored->attempts == 1);
  assert(!stored->claimed_at_ms.has_value());
  assert(!stored->processed_at_ms.has_value());

  auto again = q.Claim(10);
  assert(again.size() == 1);
  assert(again[0].attempts == 2);
}

void TestAttemptCeiling() {
  Fixture f;
  auto    q = f.Queue(120s, 2);

  q.Enqueue("srv-1");
  for (uint32_t attempt = 1; attempt <= 2; ++attempt) {
    auto job = q.Claim(10).at(0);
    assert(job.attempts == attempt);
    q.MarkFailed(job.id, "boom", job.attempts);
  }
  assert(q.Claim(10).empty());

  // still pending, so a new heartbeat only refreshes it
  q.Enqueue("srv-1");
  assert(q.ListForServer("srv-1").size() == 1);
}

void TestUnlimitedAttempts() {
  Fixture f;
  auto    q = f.Queue(120s, 0);

  q.Enqueue("srv-1");
  for (int i = 0; i < 10; ++i) {
    auto job = q.Claim(1).at(0);
    q.MarkFailed(job.id, "boom", job.attempts);
  }
  assert(q.Claim(1).size() == 1);
}

void TestEmptyBatch() {
  Fixture f;
  auto    q = f.Queue();
  q.Enqueue("srv-1");
  assert(q.Claim(0).empty());
  assert(q.Claim(10).size() == 1);
}

void TestUnknownJobThrows() {
  Fixture f;
  auto    q = f.Queue();

  bool threw = false;
  try {
    beacon::db::model::JobRecord unknown;
    unknown.id = 999;
    q.MarkProcessed(unknown, f.clock.Now());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    q.MarkFailed(999, "boom", 1);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!q.Get(999).has_value());
}

void TestRepositoryRequired() {
  bool threw = false;
  try {
    JobQueue q(nullptr, {});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestOnePendingJobPerServer();
  TestProcessedJobAllowsNewOne();
  TestEnqueueWhileClaimedKeepsJobPending();
  TestEnqueueInSameMillisecondAsClaimIsNotLost();
  TestClaimOrdersByEnqueueTime();
  TestClaimLeaseExpires();
  TestMarkFailedReleasesClaim();
  TestAttemptCeiling();
  TestUnlimitedAttempts();
  TestEmptyBatch();
  TestUnknownJobThrows();
  TestRepositoryRequired();

  std::cout << "beacon_unit_job_queue: pass\n";
  return 0;
}
