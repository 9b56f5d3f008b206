#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/ingest_gate.hpp"
#include "internal/keys/key_material_cache.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/server_state_service.hpp"
#include "internal/worker/heartbeat_worker.hpp"

#if BEACON_WITH_GRPC
#include <grpcpp/impl/service_type.h>
#endif

namespace beacon::factory {

/*
  Application

  Owns every long-lived component of the server process. The worker is
  constructed but not started.
*/
struct Application {
  std::shared_ptr<db::Repository>         repository;
  std::shared_ptr<keys::KeyMaterialCache> key_cache;
  std::shared_ptr<queue::JobQueue>        jobs;
  std::shared_ptr<ingest::IngestGate>     gate;
  std::shared_ptr<worker::HeartbeatWorker> worker;

  std::shared_ptr<service::IngestService>      ingest_service;
  std::shared_ptr<service::ServerStateService> server_state_service;

#if BEACON_WITH_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif
};

// Option mapping from RuntimeConfig. Unset or zero fields take the defaults.
ingest::IngestGateOptions       IngestOptionsFromConfig(const beacon::runtime::config::RuntimeConfig& config);
worker::HeartbeatWorkerOptions  WorkerOptionsFromConfig(const beacon::runtime::config::RuntimeConfig& config);
queue::JobQueue::Options        QueueOptionsFromConfig(const beacon::runtime::config::RuntimeConfig& config);
keys::KeyMaterialCache::Options KeyCacheOptionsFromConfig(const beacon::runtime::config::RuntimeConfig& config);

// memory (default), sqlite or postgres; schema is bootstrapped.
std::shared_ptr<db::Repository> BuildRepository(const beacon::runtime::config::RuntimeConfig& config);

/*
  Composition root. The only place that knows concrete backend types.
*/
Application Build(const beacon::runtime::config::RuntimeConfig& config);

} // namespace beacon::factory
