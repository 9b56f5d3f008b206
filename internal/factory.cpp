#include "factory.hpp"

#include <set>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/eligibility.hpp"
#include "internal/service/service_context.hpp"
#if BEACON_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if BEACON_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#if BEACON_WITH_GRPC
#include "internal/grpc/ingest_server.hpp"
#include "internal/grpc/server_state_server.hpp"
#endif

namespace beacon::factory {

using beacon::runtime::config::RuntimeConfig;

namespace {

template <typename T>
T OrDefault(T value, T fallback) {
  return value == 0 ? fallback : value;
}

keys::GraceWindowPolicy GracePolicyFromConfig(const RuntimeConfig& config) {
  const auto&             ingest = config.ingest();
  keys::GraceWindowPolicy policy;
  policy.default_seconds = OrDefault<std::int64_t>(ingest.default_grace_seconds(), policy.default_seconds);
  policy.min_seconds     = OrDefault<std::int64_t>(ingest.min_grace_seconds(), policy.min_seconds);
  policy.max_seconds     = OrDefault<std::int64_t>(ingest.max_grace_seconds(), policy.max_seconds);
  if (policy.min_seconds > policy.max_seconds) {
    throw std::invalid_argument("ingest.min_grace_seconds exceeds ingest.max_grace_seconds");
  }
  return policy;
}

engines::EngineOptions EngineOptionsFromConfig(const RuntimeConfig& config) {
  const auto&            engines = config.engines();
  engines::EngineOptions options;
  options.uptime_window    = std::chrono::hours(OrDefault<std::int64_t>(engines.uptime_window_hours(), options.uptime_window.count()));
  options.anomaly_decay    = std::chrono::minutes(OrDefault<std::int64_t>(engines.anomaly_decay_minutes(), options.anomaly_decay.count()));
  options.default_capacity = OrDefault<std::int64_t>(engines.default_capacity(), options.default_capacity);
  return options;
}

std::shared_ptr<ingest::EligibilityPolicy> BuildEligibility(const RuntimeConfig& config) {
  const auto& denied = config.ingest().denied_server_ids();
  if (denied.empty()) return std::make_shared<ingest::AllowAllPolicy>();
  return std::make_shared<ingest::DenyListPolicy>(std::set<std::string>(denied.begin(), denied.end()));
}

} // namespace

ingest::IngestGateOptions IngestOptionsFromConfig(const RuntimeConfig& config) {
  const auto&               ingest = config.ingest();
  ingest::IngestGateOptions options;
  options.grace = GracePolicyFromConfig(config);
  if (ingest.has_enforce_timestamp_window()) options.enforce_timestamp_window = ingest.enforce_timestamp_window();
  options.max_future_skew   = std::chrono::seconds(OrDefault<std::int64_t>(ingest.max_future_skew_seconds(), options.max_future_skew.count()));
  options.min_agent_version = ingest.min_agent_version();
  if (ingest.has_record_rejections()) options.record_rejections = ingest.record_rejections();
  return options;
}

worker::HeartbeatWorkerOptions WorkerOptionsFromConfig(const RuntimeConfig& config) {
  const auto&                    worker = config.worker();
  worker::HeartbeatWorkerOptions options;
  options.poll_interval = std::chrono::milliseconds(OrDefault<std::int64_t>(worker.poll_interval_ms(), options.poll_interval.count()));
  options.error_backoff = std::chrono::milliseconds(OrDefault<std::int64_t>(worker.error_backoff_ms(), options.error_backoff.count()));
  options.batch_size    = OrDefault<uint32_t>(worker.batch_size(), options.batch_size);
  options.history_limit = OrDefault<uint32_t>(worker.history_limit(), options.history_limit);
  options.grace         = GracePolicyFromConfig(config);
  options.engines       = EngineOptionsFromConfig(config);
  return options;
}

queue::JobQueue::Options QueueOptionsFromConfig(const RuntimeConfig& config) {
  queue::JobQueue::Options options;
  options.claim_ttl    = std::chrono::seconds(OrDefault<std::int64_t>(config.worker().claim_ttl_seconds(), options.claim_ttl.count()));
  options.max_attempts = config.worker().max_attempts();
  return options;
}

keys::KeyMaterialCache::Options KeyCacheOptionsFromConfig(const RuntimeConfig& config) {
  keys::KeyMaterialCache::Options options;
  options.ttl       = std::chrono::seconds(OrDefault<std::int64_t>(config.key_cache().ttl_seconds(), options.ttl.count()));
  options.max_stale = std::chrono::seconds(OrDefault<std::int64_t>(config.key_cache().max_stale_seconds(), options.max_stale.count()));
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if BEACON_DB_SQLITE
    if (database.sqlite().path().empty()) throw std::invalid_argument("database.sqlite.path is required");
    const int busy_timeout_ms = static_cast<int>(OrDefault<uint32_t>(database.sqlite().busy_timeout_ms(), 5000));
    auto      sqlite_db       = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), busy_timeout_ms);
    db::sqlite::SqliteRepository::Bootstrap(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if BEACON_DB_POSTGRES
    if (database.postgres().connection_uri().empty()) throw std::invalid_argument("database.postgres.connection_uri is required");
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                       OrDefault<uint32_t>(database.postgres().max_connections(), 16));
    db::postgres::PgRepository::Bootstrap(*pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config);
  app.key_cache  = std::make_shared<keys::KeyMaterialCache>(keys::KeyMaterialCache::RepositoryLoader(app.repository),
                                                           KeyCacheOptionsFromConfig(config));
  app.jobs       = std::make_shared<queue::JobQueue>(app.repository, QueueOptionsFromConfig(config));
  app.gate       = std::make_shared<ingest::IngestGate>(app.repository, app.key_cache, app.jobs, BuildEligibility(config),
                                                  IngestOptionsFromConfig(config));
  app.worker     = std::make_shared<worker::HeartbeatWorker>(app.repository, app.jobs, WorkerOptionsFromConfig(config));

  service::ServiceContext ctx;
  ctx.gate             = app.gate;
  ctx.repository       = app.repository;
  ctx.default_capacity = EngineOptionsFromConfig(config).default_capacity;

  app.ingest_service       = std::make_shared<service::IngestService>(ctx);
  app.server_state_service = std::make_shared<service::ServerStateService>(ctx);

#if BEACON_WITH_GRPC
  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(app.ingest_service));
  app.grpc_services.push_back(std::make_unique<grpc::ServerStateServer>(app.server_state_service));
#endif

  return app;
}

} // namespace beacon::factory
