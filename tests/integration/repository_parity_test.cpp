#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/ingest_gate.hpp"
#include "tests/support/beacon_test_support.hpp"

#if BEACON_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if BEACON_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using beacon::db::ErrorCode;
using beacon::db::Repository;
using beacon::db::memory::MemoryRepository;
using beacon::db::model::ClusterRecord;
using beacon::db::model::DerivedStateUpdate;
using beacon::db::model::FastPathUpdate;
using beacon::db::model::HeartbeatRecord;
using beacon::db::model::JobRecord;
using beacon::db::model::RejectionRecord;
using beacon::db::model::ServerRecord;
using beacon::model::Confidence;
using beacon::model::EffectiveStatus;

const std::string kPrivateKey = "nWGxne/9WmC6hEr0kuwsxERJxWl7MmkZcDusAxyuf2A=";
const std::string kPublicKey  = "11qYAYKxCrfVS/7TyWQHOg7hcvPapiMlrwIaaPcHURo=";

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

void Register(Repository& repo, const std::string& cluster_id, const std::vector<std::string>& server_ids) {
  auto tx = repo.Begin();

  ClusterRecord cluster{.id = cluster_id, .public_key_ed25519 = "pk-" + cluster_id, .key_version = 1, .heartbeat_grace_seconds = std::nullopt};
  assert(repo.UpsertCluster(*tx, cluster));
  for (const auto& id : server_ids) {
    ServerRecord server;
    server.id         = id;
    server.cluster_id = cluster_id;
    assert(repo.InsertServer(*tx, server));
  }
  tx->Commit();
}

HeartbeatRecord Heartbeat(const std::string& server_id, const std::string& heartbeat_id, uint64_t received_at_ms) {
  HeartbeatRecord hb;
  hb.id                 = server_id + "/" + heartbeat_id;
  hb.server_id          = server_id;
  hb.heartbeat_id       = heartbeat_id;
  hb.key_version        = 1;
  hb.agent_timestamp_ms = received_at_ms - 250;
  hb.received_at_ms     = received_at_ms;
  hb.status             = beacon::model::HeartbeatStatus::kOnline;
  hb.signature          = "sig";
  return hb;
}

beacon::db::Result InsertHeartbeat(Repository& repo, const HeartbeatRecord& hb) {
  auto tx     = repo.Begin();
  auto result = repo.InsertHeartbeat(*tx, hb);
  if (result) {
    tx->Commit();
  } else {
    tx->Rollback();
  }
  return result;
}

std::optional<ServerRecord> LoadServer(Repository& repo, const std::string& id) {
  auto tx     = repo.Begin();
  auto server = repo.GetServer(*tx, id);
  tx->Commit();
  return server;
}

std::vector<JobRecord> OwnJobs(const std::vector<JobRecord>& jobs, const std::string& prefix) {
  std::vector<JobRecord> out;
  std::copy_if(jobs.begin(), jobs.end(), std::back_inserter(out), [&](const JobRecord& j) { return j.server_id.rfind(prefix, 0) == 0; });
  return out;
}

std::vector<JobRecord> Claim(Repository& repo, const std::string& prefix, uint64_t now_ms, uint64_t ttl_ms, uint32_t max_attempts) {
  auto tx   = repo.Begin();
  auto jobs = repo.ClaimJobs(*tx, 1000, now_ms, ttl_ms, max_attempts);
  tx->Commit();
  return OwnJobs(jobs, prefix);
}

void VerifyRegistry(Repository& repo, const std::string& p) {
  Register(repo, p + "cl", {p + "srv"});

  {
    auto tx = repo.Begin();
    auto key = repo.GetKeyMaterial(*tx, p + "srv");
    assert(key.has_value());
    assert(key->cluster_id == p + "cl");
    assert(key->public_key_ed25519 == "pk-" + p + "cl");
    assert(key->key_version == 1);
    assert(!key->heartbeat_grace_seconds.has_value());
    assert(!repo.GetKeyMaterial(*tx, p + "missing").has_value());
    tx->Commit();
  }

  {
    // rotation replaces key and version in place
    auto          tx = repo.Begin();
    ClusterRecord rotated{.id = p + "cl", .public_key_ed25519 = "pk-rotated", .key_version = 2, .heartbeat_grace_seconds = 900};
    assert(repo.UpsertCluster(*tx, rotated));
    auto cluster = repo.GetCluster(*tx, p + "cl");
    assert(cluster->public_key_ed25519 == "pk-rotated");
    assert(cluster->key_version == 2);
    assert(cluster->heartbeat_grace_seconds == 900);
    tx->Commit();
  }

  auto server = LoadServer(repo, p + "srv");
  assert(server.has_value());
  assert(server->effective_status == EffectiveStatus::kUnknown);
  assert(server->confidence == Confidence::kRed);
  assert(!server->uptime_percent.has_value());
  assert(!server->quality_score.has_value());
  assert(!server->anomaly_players_spike);
  assert(!server->last_seen_at_ms.has_value());
  assert(server->updated_at_ms == 0);

  {
    auto         tx = repo.Begin();
    ServerRecord dup;
    dup.id         = p + "srv";
    dup.cluster_id = p + "cl";
    assert(repo.InsertServer(*tx, dup).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
  {
    auto         tx = repo.Begin();
    ServerRecord orphan;
    orphan.id         = p + "orphan";
    orphan.cluster_id = p + "no-such-cluster";
    assert(repo.InsertServer(*tx, orphan).code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }
  assert(!LoadServer(repo, p + "orphan").has_value());
}

void VerifyHeartbeatInsertOutcomes(Repository& repo, const std::string& p) {
  Register(repo, p + "cl", {p + "a", p + "b"});
  const uint64_t base = NowMs();

  auto hb        = Heartbeat(p + "a", p + "hb-1", base);
  hb.map_name    = "de_dust2";
  hb.players_current = 0;
  assert(InsertHeartbeat(repo, hb));

  auto replay = Heartbeat(p + "a", p + "hb-1", base + 5);
  replay.id   = p + "other-row";
  assert(InsertHeartbeat(repo, replay).code == ErrorCode::AlreadyExists);

  auto hijack = Heartbeat(p + "b", p + "hb-1", base + 10);
  assert(InsertHeartbeat(repo, hijack).code == ErrorCode::Conflict);

  auto ghost = Heartbeat(p + "ghost", p + "hb-ghost", base);
  assert(InsertHeartbeat(repo, ghost).code == ErrorCode::ConstraintViolation);

  {
    // a replayed insert leaves the transaction usable
    auto tx = repo.Begin();
    assert(repo.InsertHeartbeat(*tx, replay).code == ErrorCode::AlreadyExists);
    assert(repo.InsertHeartbeat(*tx, hijack).code == ErrorCode::Conflict);
    assert(repo.InsertHeartbeat(*tx, Heartbeat(p + "a", p + "hb-2", base + 20)));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetHeartbeat(*tx, p + "a", p + "hb-1");
  assert(stored.has_value());
  assert(stored->id == hb.id);
  assert(stored->received_at_ms == base);
  assert(stored->agent_timestamp_ms == base - 250);
  assert(stored->map_name == "de_dust2");
  assert(stored->players_current == 0);
  assert(!stored->players_capacity.has_value());
  assert(!stored->agent_version.has_value());
  assert(!repo.GetHeartbeat(*tx, p + "b", p + "hb-1").has_value());
  assert(repo.GetHeartbeat(*tx, p + "a", p + "hb-2").has_value());
  assert(repo.ListRecentHeartbeats(*tx, p + "a", 100).size() == 2);
  tx->Commit();
}

void VerifyRecentHeartbeatOrder(Repository& repo, const std::string& p) {
  Register(repo, p + "cl", {p + "srv"});
  const uint64_t base = NowMs();

  // inserted out of order on purpose
  for (uint64_t offset : {20u, 0u, 40u, 10u, 30u}) {
    assert(InsertHeartbeat(repo, Heartbeat(p + "srv", p + "hb-" + std::to_string(offset), base + offset * 1000)));
  }

  auto tx   = repo.Begin();
  auto rows = repo.ListRecentHeartbeats(*tx, p + "srv", 3);
  assert(rows.size() == 3);
  assert(rows[0].received_at_ms == base + 40'000);
  assert(rows[1].received_at_ms == base + 30'000);
  assert(rows[2].received_at_ms == base + 20'000);
  assert(repo.ListRecentHeartbeats(*tx, p + "srv", 100).size() == 5);
  assert(repo.ListRecentHeartbeats(*tx, p + "nobody", 100).empty());
  tx->Commit();

  // equal received_at: the later insert comes first
  assert(InsertHeartbeat(repo, Heartbeat(p + "srv", p + "hb-tie-a", base + 50'000)));
  assert(InsertHeartbeat(repo, Heartbeat(p + "srv", p + "hb-tie-b", base + 50'000)));

  auto tie_tx = repo.Begin();
  auto ties   = repo.ListRecentHeartbeats(*tie_tx, p + "srv", 3);
  tie_tx->Commit();
  assert(ties.size() == 3);
  assert(ties[0].heartbeat_id == p + "hb-tie-b");
  assert(ties[1].heartbeat_id == p + "hb-tie-a");
  assert(ties[2].received_at_ms == base + 40'000);
}

void VerifyRollbackDiscardsInsert(Repository& repo, const std::string& p) {
  Register(repo, p + "cl", {p + "srv"});
  {
    auto tx = repo.Begin();
    assert(repo.InsertHeartbeat(*tx, Heartbeat(p + "srv", p + "hb-rolled-back", NowMs())));
    tx->Rollback();
  }
  auto tx = repo.Begin();
  assert(!repo.GetHeartbeat(*tx, p + "srv", p + "hb-rolled-back").has_value());
  tx->Commit();

  // the id is free again
  assert(InsertHeartbeat(repo, Heartbeat(p + "srv", p + "hb-rolled-back", NowMs())));
}

void VerifyFastPathAndDerivedStateColumns(Repository& repo, const std::string& p) {
  Register(repo, p + "cl", {p + "srv"});
  const uint64_t base = NowMs();

  {
    auto           tx = repo.Begin();
    FastPathUpdate fast{.server_id = p + "srv", .last_seen_at_ms = base, .players_current = 12, .players_capacity = 64, .status_source = "agent"};
    assert(repo.ApplyFastPath(*tx, fast));
    tx->Commit();
  }
  {
    // absent counts keep the previous values
    auto           tx = repo.Begin();
    FastPathUpdate fast{.server_id = p + "srv", .last_seen_at_ms = base + 1, .players_current = std::nullopt, .players_capacity = std::nullopt,
                        .status_source = "agent"};
    assert(repo.ApplyFastPath(*tx, fast));
    tx->Commit();
  }

  auto after_fast = LoadServer(repo, p + "srv");
  assert(after_fast->last_seen_at_ms == base + 1);
  assert(after_fast->players_current == 12);
  assert(after_fast->players_capacity == 64);
  assert(after_fast->status_source == "agent");
  assert(after_fast->effective_status == EffectiveStatus::kUnknown);
  assert(!after_fast->last_heartbeat_at_ms.has_value());

  {
    auto               tx = repo.Begin();
    DerivedStateUpdate derived;
    derived.server_id                   = p + "srv";
    derived.effective_status            = EffectiveStatus::kOnline;
    derived.confidence                  = Confidence::kYellow;
    derived.uptime_percent              = 87.5;
    derived.quality_score               = 91.25;
    derived.anomaly_players_spike       = true;
    derived.anomaly_last_detected_at_ms = base - 100;
    derived.players_current             = std::nullopt;
    derived.players_capacity            = 64;
    derived.last_heartbeat_at_ms        = base - 100;
    derived.updated_at_ms               = base + 2;
    assert(repo.ApplyDerivedState(*tx, derived));
    tx->Commit();
  }

  auto after_derived = LoadServer(repo, p + "srv");
  assert(after_derived->effective_status == EffectiveStatus::kOnline);
  assert(after_derived->confidence == Confidence::kYellow);
  assert(after_derived->uptime_percent == 87.5);
  assert(after_derived->quality_score == 91.25);
  assert(after_derived->anomaly_players_spike);
  assert(after_derived->anomaly_last_detected_at_ms == base - 100);
  // the worker snapshot replaces the counts, including with null
  assert(!after_derived->players_current.has_value());
  assert(after_derived->players_capacity == 64);
  assert(after_derived->last_heartbeat_at_ms == base - 100);
  assert(after_derived->updated_at_ms == base + 2);
  // fast-path columns are untouched
  assert(after_derived->last_seen_at_ms == base + 1);
  assert(after_derived->status_source == "agent");

  auto           tx = repo.Begin();
  FastPathUpdate missing{.server_id = p + "missing", .last_seen_at_ms = base, .players_current = std::nullopt, .players_capacity = std::nullopt,
                         .status_source = "agent"};
  assert(repo.ApplyFastPath(*tx, missing).code == ErrorCode::NotFound);
  DerivedStateUpdate missing_derived;
  missing_derived.server_id = p + "missing";
  assert(repo.ApplyDerivedState(*tx, missing_derived).code == ErrorCode::NotFound);
  tx->Rollback();
}

void VerifyJobQueue(Repository& repo, const std::string& p) {
  Register(repo, p + "cl", {p + "a", p + "b"});
  const uint64_t base = NowMs();
  const uint64_t ttl  = 120'000;

  {
    auto tx = repo.Begin();
    assert(repo.UpsertPendingJob(*tx, p + "a", base));
    assert(repo.UpsertPendingJob(*tx, p + "b", base + 1));
    assert(repo.UpsertPendingJob(*tx, p + "a", base + 2));
    auto jobs = repo.ListJobsForServer(*tx, p + "a");
    assert(jobs.size() == 1);
    assert(jobs[0].enqueued_at_ms == base + 2);
    assert(jobs[0].attempts == 0);
    tx->Commit();
  }

  auto claimed = Claim(repo, p, base + 10, ttl, 0);
  assert(claimed.size() == 2);
  assert(claimed[0].server_id == p + "b");
  assert(claimed[1].server_id == p + "a");
  assert(claimed[0].attempts == 1);
  assert(claimed[0].claimed_at_ms == base + 10);

  assert(Claim(repo, p, base + 10 + ttl, ttl, 0).empty());

  auto job_a = claimed[1];
  {
    auto tx = repo.Begin();
    assert(repo.MarkJobFailed(*tx, job_a.id, "boom", job_a.attempts));
    assert(repo.MarkJobProcessed(*tx, claimed[0].id, claimed[0].enqueued_at_ms, base + 20));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto failed = repo.GetJob(*tx, job_a.id);
    assert(failed->last_error == "boom");
    assert(!failed->claimed_at_ms.has_value());
    assert(!failed->processed_at_ms.has_value());

    auto done = repo.GetJob(*tx, claimed[0].id);
    assert(done->processed_at_ms == base + 20);
    assert(!done->claimed_at_ms.has_value());
    assert(!repo.GetJob(*tx, 987'654'321).has_value());
    assert(repo.MarkJobProcessed(*tx, 987'654'321, base, base).code == ErrorCode::NotFound);
    tx->Rollback();
  }

  // released by MarkJobFailed, so no lease wait
  auto again = Claim(repo, p, base + 30, ttl, 0);
  assert(again.size() == 1);
  assert(again[0].id == job_a.id);
  assert(again[0].attempts == 2);

  // ceiling of 2 attempts is reached once the lease lapses
  assert(Claim(repo, p, base + 31 + ttl, ttl, 2).empty());
  assert(Claim(repo, p, base + 31 + ttl, ttl, 0).size() == 1);

  {
    // a processed job does not block a new pending one
    auto tx = repo.Begin();
    assert(repo.UpsertPendingJob(*tx, p + "b", base + 40));
    auto jobs = repo.ListJobsForServer(*tx, p + "b");
    assert(jobs.size() == 2);
    assert(jobs[0].processed_at_ms.has_value());
    assert(!jobs[1].processed_at_ms.has_value());
    tx->Commit();
  }
}

void VerifyJobReenqueuedWhileClaimed(Repository& repo, const std::string& p) {
  Register(repo, p + "cl", {p + "srv"});
  const uint64_t base = NowMs();
  const uint64_t ttl  = 120'000;

  {
    auto tx = repo.Begin();
    assert(repo.UpsertPendingJob(*tx, p + "srv", base));
    tx->Commit();
  }
  auto claimed = Claim(repo, p, base + 10, ttl, 0);
  assert(claimed.size() == 1);
  const auto job = claimed[0];
  assert(job.enqueued_at_ms == base);

  {
    // a refresh in the same millisecond still moves enqueued_at
    auto tx = repo.Begin();
    assert(repo.UpsertPendingJob(*tx, p + "srv", base));
    auto jobs = repo.ListJobsForServer(*tx, p + "srv");
    assert(jobs.size() == 1);
    assert(jobs[0].id == job.id);
    assert(jobs[0].enqueued_at_ms == base + 1);
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.MarkJobProcessed(*tx, job.id, job.enqueued_at_ms, base + 20).code == ErrorCode::Conflict);
    tx->Commit();
  }
  {
    auto tx      = repo.Begin();
    auto pending = repo.GetJob(*tx, job.id);
    assert(pending.has_value());
    assert(!pending->processed_at_ms.has_value());
    assert(!pending->claimed_at_ms.has_value());
    assert(pending->attempts == 0);
    tx->Commit();
  }

  // released, so no lease wait
  auto again = Claim(repo, p, base + 30, ttl, 0);
  assert(again.size() == 1);
  assert(again[0].id == job.id);
  assert(again[0].attempts == 1);
  {
    auto tx = repo.Begin();
    assert(repo.MarkJobProcessed(*tx, job.id, again[0].enqueued_at_ms, base + 40));
    tx->Commit();
  }
  {
    auto tx   = repo.Begin();
    auto done = repo.GetJob(*tx, job.id);
    assert(done->processed_at_ms == base + 40);
    tx->Commit();
  }
  assert(Claim(repo, p, base + 50 + ttl, ttl, 0).empty());
}

void VerifyConcurrentReplay(const std::shared_ptr<Repository>& repo, const std::string& p) {
  beacon::testing::RegisterCluster(*repo, p + "cl", kPublicKey, 1);
  beacon::testing::RegisterServer(*repo, p + "srv", p + "cl");

  auto cache = std::make_shared<beacon::keys::KeyMaterialCache>(beacon::keys::KeyMaterialCache::RepositoryLoader(repo),
                                                                beacon::keys::KeyMaterialCache::Options{}, beacon::util::Now);
  auto jobs  = std::make_shared<beacon::queue::JobQueue>(repo, beacon::queue::JobQueue::Options{}, beacon::util::Now);
  beacon::ingest::IngestGate gate(repo, cache, jobs, nullptr, beacon::ingest::IngestGateOptions{}, beacon::util::Now);

  const auto hb = beacon::testing::SignedHeartbeat(kPrivateKey, p + "srv", p + "hb-race", beacon::util::Now(), 1, 7, 32);

  constexpr int    kThreads = 8;
  std::atomic<int> fresh{0};
  std::atomic<int> replays{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      auto r = gate.Admit(hb);
      assert(r.accepted);
      if (r.replay) {
        ++replays;
      } else {
        ++fresh;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(fresh == 1);
  assert(replays == kThreads - 1);

  auto tx = repo->Begin();
  assert(repo->ListRecentHeartbeats(*tx, p + "srv", 100).size() == 1);
  auto pending = repo->ListJobsForServer(*tx, p + "srv");
  assert(pending.size() == 1);
  assert(!pending[0].processed_at_ms.has_value());
  tx->Commit();
}

void VerifyRejections(Repository& repo, const std::string& p) {
  Register(repo, p + "cl", {p + "srv"});
  const uint64_t base = NowMs() + 60'000;

  {
    auto            tx = repo.Begin();
    RejectionRecord anonymous;
    anonymous.id               = p + "rej-1";
    anonymous.received_at_ms   = base;
    anonymous.rejection_reason = "server_not_found";
    anonymous.metadata_json    = R"({"detail":"server not registered","heartbeat_id":"hb-x","key_version":1})";
    assert(repo.InsertRejection(*tx, anonymous));

    RejectionRecord known;
    known.id               = p + "rej-2";
    known.received_at_ms   = base + 1;
    known.server_id        = p + "srv";
    known.rejection_reason = "invalid_signature";
    known.agent_version    = "1.4.0";
    assert(repo.InsertRejection(*tx, known));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto rows = repo.ListRejections(*tx, 2);
  tx->Commit();

  assert(rows.size() == 2);
  assert(rows[0].id == p + "rej-2");
  assert(rows[0].server_id == p + "srv");
  assert(rows[0].agent_version == "1.4.0");
  assert(rows[0].event_type == "server.heartbeat.v1");
  assert(rows[1].id == p + "rej-1");
  assert(!rows[1].server_id.has_value());
  assert(rows[1].rejection_reason == "server_not_found");
  assert(rows[1].metadata_json.find("\"heartbeat_id\"") != std::string::npos);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& p) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  Register(*repo, p + "cl", {p + "srv"});
  assert(InsertHeartbeat(*repo, Heartbeat(p + "srv", p + "hb-durable", NowMs())));
  {
    auto tx = repo->Begin();
    assert(repo->UpsertPendingJob(*tx, p + "srv", NowMs()));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetKeyMaterial(*tx, p + "srv").has_value());
  assert(repo->GetHeartbeat(*tx, p + "srv", p + "hb-durable").has_value());
  assert(repo->ListJobsForServer(*tx, p + "srv").size() == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if BEACON_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("beacon_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<beacon::db::sqlite::SqliteDB>(db_path);
    beacon::db::sqlite::SqliteRepository::Bootstrap(*db);
    return std::make_shared<beacon::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if BEACON_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("BEACON_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("BEACON_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<beacon::db::postgres::PgPool>(conninfo);
    beacon::db::postgres::PgRepository::Bootstrap(*pool);
    return std::make_shared<beacon::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run; the postgres database outlives the test
  const std::string run = backend.name + "-" + std::to_string(NowMs()) + "-";

  VerifyRegistry(*repo, run + "registry-");
  VerifyHeartbeatInsertOutcomes(*repo, run + "insert-");
  VerifyRecentHeartbeatOrder(*repo, run + "order-");
  VerifyRollbackDiscardsInsert(*repo, run + "rollback-");
  VerifyFastPathAndDerivedStateColumns(*repo, run + "columns-");
  VerifyJobQueue(*repo, run + "jobs-");
  VerifyJobReenqueuedWhileClaimed(*repo, run + "requeue-");
  VerifyConcurrentReplay(repo, run + "race-");
  VerifyRejections(*repo, run + "rejections-");

  VerifyRestartDurability(backend, run + "durable-");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if BEACON_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if BEACON_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "beacon_integration_repository_parity: pass\n";
  return 0;
}
