#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "tests/support/beacon_test_support.hpp"

namespace {

using namespace std::chrono_literals;
using beacon::runtime::config::RuntimeConfig;

const std::string kPrivateKey = "nWGxne/9WmC6hEr0kuwsxERJxWl7MmkZcDusAxyuf2A=";
const std::string kPublicKey  = "11qYAYKxCrfVS/7TyWQHOg7hcvPapiMlrwIaaPcHURo=";

void TestDefaults() {
  RuntimeConfig config;

  auto ingest = beacon::factory::IngestOptionsFromConfig(config);
  assert(ingest.grace.default_seconds == 600);
  assert(ingest.grace.min_seconds == 60);
  assert(ingest.grace.max_seconds == 3600);
  assert(ingest.enforce_timestamp_window);
  assert(ingest.max_future_skew == 60s);
  assert(ingest.min_agent_version.empty());
  assert(ingest.record_rejections);

  auto worker = beacon::factory::WorkerOptionsFromConfig(config);
  assert(worker.poll_interval == 5000ms);
  assert(worker.batch_size == 50);
  assert(worker.history_limit == 500);
  assert(worker.engines.uptime_window == 24h);
  assert(worker.engines.anomaly_decay == 30min);
  assert(worker.engines.default_capacity == 70);

  auto queue = beacon::factory::QueueOptionsFromConfig(config);
  assert(queue.claim_ttl == 120s);
  assert(queue.max_attempts == 0);

  auto cache = beacon::factory::KeyCacheOptionsFromConfig(config);
  assert(cache.ttl == 60s);
  assert(cache.max_stale == 600s);
}

void TestOverrides() {
  auto config = beacon::config::ConfigLoader::LoadFromYamlString(R"(ingest:
  default_grace_seconds: 120
  min_grace_seconds: 30
  max_grace_seconds: 240
  enforce_timestamp_window: false
  record_rejections: false
  min_agent_version: "1.2.0"
worker:
  poll_interval_ms: 100
  batch_size: 7
  claim_ttl_seconds: 15
  max_attempts: 3
engines:
  anomaly_decay_minutes: 5
  default_capacity: 16
key_cache:
  ttl_seconds: 5
)");

  auto ingest = beacon::factory::IngestOptionsFromConfig(config);
  assert(ingest.grace.default_seconds == 120);
  assert(ingest.grace.max_seconds == 240);
  assert(!ingest.enforce_timestamp_window);
  assert(!ingest.record_rejections);
  assert(ingest.min_agent_version == "1.2.0");

  auto worker = beacon::factory::WorkerOptionsFromConfig(config);
  assert(worker.poll_interval == 100ms);
  assert(worker.batch_size == 7);
  assert(worker.grace.min_seconds == 30);
  assert(worker.engines.anomaly_decay == 5min);
  assert(worker.engines.default_capacity == 16);

  auto queue = beacon::factory::QueueOptionsFromConfig(config);
  assert(queue.claim_ttl == 15s);
  assert(queue.max_attempts == 3);

  auto cache = beacon::factory::KeyCacheOptionsFromConfig(config);
  assert(cache.ttl == 5s);
  assert(cache.max_stale == 600s);
}

void TestInvertedGraceBoundsRejected() {
  RuntimeConfig config;
  config.mutable_ingest()->set_min_grace_seconds(900);
  config.mutable_ingest()->set_max_grace_seconds(300);

  bool threw = false;
  try {
    (void)beacon::factory::IngestOptionsFromConfig(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestMemoryRepositoryIsDefault() {
  RuntimeConfig config;
  auto          repo = beacon::factory::BuildRepository(config);
  assert(dynamic_cast<beacon::db::memory::MemoryRepository*>(repo.get()) != nullptr);

  config.mutable_database()->mutable_memory();
  repo = beacon::factory::BuildRepository(config);
  assert(dynamic_cast<beacon::db::memory::MemoryRepository*>(repo.get()) != nullptr);
}

void TestSqliteRepository() {
  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite();

  bool threw = false;
  try {
    (void)beacon::factory::BuildRepository(config);
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);

#if BEACON_DB_SQLITE
  const auto dir = std::filesystem::temp_directory_path() / "beacon_factory_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "factory.db";
  std::filesystem::remove(path);
  config.mutable_database()->mutable_sqlite()->set_path(path.string());

  {
    auto repo = beacon::factory::BuildRepository(config);
    beacon::testing::RegisterCluster(*repo, "cl-1", kPublicKey, 1);
    beacon::testing::RegisterServer(*repo, "srv-1", "cl-1");
  }

  // bootstrap is idempotent and the registry survives a reopen
  auto reopened = beacon::factory::BuildRepository(config);
  auto server   = beacon::testing::LoadServer(*reopened, "srv-1");
  assert(server.has_value());
  assert(server->cluster_id == "cl-1");
  std::filesystem::remove(path);
#endif
}

void TestBuildWiresPipeline() {
  auto config = beacon::config::ConfigLoader::LoadFromYamlString("worker:\n  batch_size: 10\n");
  auto app    = beacon::factory::Build(config);

  assert(app.repository && app.key_cache && app.jobs && app.gate && app.worker);
  assert(app.ingest_service && app.server_state_service);
  assert(!app.worker->IsRunning());
#if BEACON_WITH_GRPC
  assert(app.grpc_services.size() == 2);
#endif

  beacon::testing::RegisterCluster(*app.repository, "cl-1", kPublicKey, 1);
  beacon::testing::RegisterServer(*app.repository, "srv-1", "cl-1");

  auto hb = beacon::testing::SignedHeartbeat(kPrivateKey, "srv-1", "hb-factory", beacon::util::Now(), 1, 5, 20);
  assert(app.gate->Admit(hb).accepted);
  assert(app.worker->RunOnce() == 1);

  beacon::v1::GetServerStateRequest req;
  req.set_server_id("srv-1");
  auto state = app.server_state_service->GetServerState(req).state();
  assert(state.effective_status() == beacon::v1::EFFECTIVE_STATUS_ONLINE);
  assert(state.players_current() == 5);
  assert(state.ranking_score() > 0.0);
}

} // namespace

int main() {
  TestDefaults();
  TestOverrides();
  TestInvertedGraceBoundsRejected();
  TestMemoryRepositoryIsDefault();
  TestSqliteRepository();
  TestBuildWiresPipeline();

  std::cout << "beacon_unit_factory: pass\n";
  return 0;
}
