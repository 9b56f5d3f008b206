#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/grpc/server_state_server.hpp"
#include "internal/ingest/ingest_gate.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/server_state_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/support/beacon_test_support.hpp"

namespace {

const std::string kPrivateKey = "nWGxne/9WmC6hEr0kuwsxERJxWl7MmkZcDusAxyuf2A=";
const std::string kPublicKey  = "11qYAYKxCrfVS/7TyWQHOg7hcvPapiMlrwIaaPcHURo=";

beacon::service::ServiceContext BuildServiceContext() {
  auto repository = std::make_shared<beacon::db::memory::MemoryRepository>();
  beacon::testing::RegisterCluster(*repository, "cl-1", kPublicKey, 1);
  beacon::testing::RegisterServer(*repository, "srv-1", "cl-1");

  auto cache = std::make_shared<beacon::keys::KeyMaterialCache>(beacon::keys::KeyMaterialCache::RepositoryLoader(repository),
                                                                beacon::keys::KeyMaterialCache::Options{});
  auto jobs  = std::make_shared<beacon::queue::JobQueue>(repository, beacon::queue::JobQueue::Options{});

  beacon::service::ServiceContext ctx;
  ctx.gate       = std::make_shared<beacon::ingest::IngestGate>(repository, cache, jobs, nullptr, beacon::ingest::IngestGateOptions{});
  ctx.repository = repository;
  return ctx;
}

beacon::v1::SubmitHeartbeatRequest SignedRequest(const std::string& heartbeat_id) {
  auto hb = beacon::testing::SignedHeartbeat(kPrivateKey, "srv-1", heartbeat_id, beacon::util::Now());

  beacon::v1::SubmitHeartbeatRequest req;
  req.set_server_id(hb.server_id);
  req.set_key_version(hb.key_version);
  req.set_timestamp(hb.timestamp);
  req.set_heartbeat_id(hb.heartbeat_id);
  req.set_status(hb.status);
  req.set_agent_version(*hb.agent_version);
  req.set_signature(hb.signature);
  return req;
}

void TestExceptionMapping() {
  using beacon::grpc::ToStatus;
  using ::grpc::StatusCode;

  assert(ToStatus(beacon::util::InvalidArgument("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(beacon::util::PermissionDenied("x")).error_code() == StatusCode::PERMISSION_DENIED);
  assert(ToStatus(beacon::util::NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(ToStatus(beacon::util::Unauthenticated("x")).error_code() == StatusCode::UNAUTHENTICATED);
  assert(ToStatus(beacon::util::KeyVersionConflict("x")).error_code() == StatusCode::ABORTED);
  assert(ToStatus(beacon::util::FailedPrecondition("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(beacon::util::IntegrityViolation("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(ToStatus(beacon::util::AlreadyExists("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(ToStatus(std::runtime_error("x")).error_code() == StatusCode::INTERNAL);

  assert(ToStatus(beacon::util::NotFound("server not registered")).error_message() == "server not registered");
}

void TestSubmitAcceptedAndReplayed() {
  auto                     ctx = BuildServiceContext();
  beacon::grpc::IngestServer server(std::make_shared<beacon::service::IngestService>(ctx));

  const auto                          req = SignedRequest("hb-1");
  beacon::v1::SubmitHeartbeatResponse resp;
  ::grpc::ServerContext               grpc_ctx;

  assert(server.SubmitHeartbeat(&grpc_ctx, &req, &resp).ok());
  assert(resp.received());
  assert(!resp.replay());

  beacon::v1::SubmitHeartbeatResponse replay;
  assert(server.SubmitHeartbeat(&grpc_ctx, &req, &replay).ok());
  assert(replay.replay());
}

void TestSubmitTamperedReturnsUnauthenticated() {
  auto                     ctx = BuildServiceContext();
  beacon::grpc::IngestServer server(std::make_shared<beacon::service::IngestService>(ctx));

  auto req = SignedRequest("hb-1");
  req.set_status("offline");
  beacon::v1::SubmitHeartbeatResponse resp;
  ::grpc::ServerContext               grpc_ctx;

  const auto status = server.SubmitHeartbeat(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestSubmitWrongKeyVersionReturnsAborted() {
  auto                     ctx = BuildServiceContext();
  beacon::grpc::IngestServer server(std::make_shared<beacon::service::IngestService>(ctx));

  auto hb = beacon::testing::SignedHeartbeat(kPrivateKey, "srv-1", "hb-1", beacon::util::Now(), 2);
  beacon::v1::SubmitHeartbeatRequest req;
  req.set_server_id(hb.server_id);
  req.set_key_version(hb.key_version);
  req.set_timestamp(hb.timestamp);
  req.set_heartbeat_id(hb.heartbeat_id);
  req.set_status(hb.status);
  req.set_agent_version(*hb.agent_version);
  req.set_signature(hb.signature);

  beacon::v1::SubmitHeartbeatResponse resp;
  ::grpc::ServerContext               grpc_ctx;
  assert(server.SubmitHeartbeat(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ABORTED);
}

void TestGetUnknownServerReturnsNotFound() {
  auto                          ctx = BuildServiceContext();
  beacon::grpc::ServerStateServer server(std::make_shared<beacon::service::ServerStateService>(ctx));

  beacon::v1::GetServerStateRequest req;
  req.set_server_id("srv-404");
  beacon::v1::GetServerStateResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  assert(server.GetServerState(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  req.set_server_id("srv-1");
  assert(server.GetServerState(&grpc_ctx, &req, &resp).ok());
  assert(resp.state().cluster_id() == "cl-1");
}

} // namespace

int main() {
  TestExceptionMapping();
  TestSubmitAcceptedAndReplayed();
  TestSubmitTamperedReturnsUnauthenticated();
  TestSubmitWrongKeyVersionReturnsAborted();
  TestGetUnknownServerReturnsNotFound();

  std::cout << "beacon_unit_grpc_status: pass\n";
  return 0;
}
