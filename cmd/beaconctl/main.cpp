#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "beacon/v1/services.grpc.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/crypto/canonical_envelope.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/factory.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

using namespace beacon::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  beaconctl keygen\n"
            << "  beaconctl sign <private_key> <server_id> <key_version> [status] [players_current] [players_capacity]\n"
            << "  beaconctl register <config.yaml> <cluster_id> <server_id> <public_key> [key_version]\n"
            << "  beaconctl <addr> submit <private_key> <server_id> <key_version> [status] [players_current] [players_capacity]\n"
            << "  beaconctl <addr> state <server_id>\n";
}

static std::optional<int64_t> ParseInt(const std::string& text) {
  try {
    size_t     consumed = 0;
    const auto value    = std::stoll(text, &consumed);
    if (consumed != text.size()) return std::nullopt;
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// argv[first] onwards: <private_key> <server_id> <key_version> [status] [players_current] [players_capacity]
static std::optional<SubmitHeartbeatRequest> BuildSignedRequest(int argc, char** argv, int first) {
  if (argc < first + 3) return std::nullopt;

  const std::string private_key = argv[first];

  auto key_version = ParseInt(argv[first + 2]);
  if (!key_version) {
    std::cerr << "invalid key_version: " << argv[first + 2] << "\n";
    return std::nullopt;
  }

  SubmitHeartbeatRequest req;
  req.set_server_id(argv[first + 1]);
  req.set_key_version(*key_version);
  req.set_timestamp(beacon::util::FormatRfc3339Utc(beacon::util::Now()));
  req.set_heartbeat_id(beacon::util::NewUuidString());
  req.set_status(argc > first + 3 ? argv[first + 3] : "online");

  if (argc > first + 4) {
    auto players = ParseInt(argv[first + 4]);
    if (!players) {
      std::cerr << "invalid players_current: " << argv[first + 4] << "\n";
      return std::nullopt;
    }
    req.set_players_current(*players);
  }
  if (argc > first + 5) {
    auto capacity = ParseInt(argv[first + 5]);
    if (!capacity) {
      std::cerr << "invalid players_capacity: " << argv[first + 5] << "\n";
      return std::nullopt;
    }
    req.set_players_capacity(*capacity);
  }

  const auto canonical = beacon::crypto::CanonicalizeHeartbeat(beacon::service::IngestService::ToEnvelope(req));
  req.set_signature(beacon::crypto::SignEd25519(private_key, canonical));
  return req;
}

static void PrintRequest(const SubmitHeartbeatRequest& req) {
  std::cout << "canonical=" << beacon::crypto::CanonicalizeHeartbeat(beacon::service::IngestService::ToEnvelope(req)) << "\n";
  std::cout << "heartbeat_id=" << req.heartbeat_id() << "\n";
  std::cout << "timestamp=" << req.timestamp() << "\n";
  std::cout << "signature=" << req.signature() << "\n";
}

static int Register(int argc, char** argv) {
  if (argc < 6) {
    Usage();
    return 1;
  }

  int64_t key_version = 1;
  if (argc >= 7) {
    auto parsed = ParseInt(argv[6]);
    if (!parsed) {
      std::cerr << "invalid key_version: " << argv[6] << "\n";
      return 1;
    }
    key_version = *parsed;
  }

  auto config = beacon::config::ConfigLoader::LoadFromYaml(argv[2]);
  if (!config.database().has_sqlite() && !config.database().has_postgres()) {
    std::cerr << "register needs a sqlite or postgres database\n";
    return 1;
  }
  auto repository = beacon::factory::BuildRepository(config);

  beacon::db::model::ClusterRecord cluster;
  cluster.id                 = argv[3];
  cluster.public_key_ed25519 = std::string(argv[5]);
  cluster.key_version        = key_version;

  beacon::db::model::ServerRecord server;
  server.id            = argv[4];
  server.cluster_id    = cluster.id;
  server.updated_at_ms = beacon::util::ToUnixMillis(beacon::util::Now());

  auto tx = repository->Begin();
  if (auto r = repository->UpsertCluster(*tx, cluster); !r) {
    std::cerr << "cluster: " << r.Describe() << "\n";
    return 2;
  }
  if (auto r = repository->InsertServer(*tx, server); !r && r.code != beacon::db::ErrorCode::AlreadyExists) {
    std::cerr << "server: " << r.Describe() << "\n";
    return 2;
  }
  tx->Commit();

  std::cout << "registered " << server.id << " in " << cluster.id << " key_version=" << key_version << "\n";
  return 0;
}

static int Run(int argc, char** argv) {
  if (argc < 2) {
    Usage();
    return 1;
  }

  const std::string first = argv[1];

  if (first == "keygen") {
    auto pair = beacon::crypto::GenerateEd25519KeyPair();
    std::cout << "public_key=" << pair.public_key_b64 << "\n";
    std::cout << "private_key=" << pair.private_key_b64 << "\n";
    return 0;
  }

  if (first == "sign") {
    auto req = BuildSignedRequest(argc, argv, 2);
    if (!req) {
      Usage();
      return 1;
    }
    PrintRequest(*req);
    return 0;
  }

  if (first == "register") return Register(argc, argv);

  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "submit") {
    auto req = BuildSignedRequest(argc, argv, 3);
    if (!req) {
      Usage();
      return 1;
    }

    auto                    stub = HeartbeatIngestService::NewStub(channel);
    SubmitHeartbeatResponse resp;

    auto status = stub->SubmitHeartbeat(&ctx, *req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_code() << " " << status.error_message() << "\n";
      return 2;
    }

    std::cout << "heartbeat_id=" << req->heartbeat_id() << "\n";
    std::cout << "received=" << resp.received() << " processed=" << resp.processed() << " replay=" << resp.replay() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "state") {
    if (argc < 4) return 1;

    GetServerStateRequest req;
    req.set_server_id(argv[3]);

    auto                   stub = ServerStateService::NewStub(channel);
    GetServerStateResponse resp;

    auto status = stub->GetServerState(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_code() << " " << status.error_message() << "\n";
      return 2;
    }

    const auto& state = resp.state();
    std::cout << "server_id=" << state.server_id() << "\n";
    std::cout << "cluster_id=" << state.cluster_id() << "\n";
    std::cout << "effective_status=" << EffectiveStatus_Name(state.effective_status()) << "\n";
    std::cout << "confidence=" << Confidence_Name(state.confidence()) << "\n";
    if (state.has_uptime_percent()) std::cout << "uptime_percent=" << state.uptime_percent() << "\n";
    if (state.has_quality_score()) std::cout << "quality_score=" << state.quality_score() << "\n";
    std::cout << "anomaly_players_spike=" << state.anomaly_players_spike() << "\n";
    if (state.has_players_current()) std::cout << "players_current=" << state.players_current() << "\n";
    if (state.has_players_capacity()) std::cout << "players_capacity=" << state.players_capacity() << "\n";
    std::cout << "ranking_score=" << state.ranking_score() << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  try {
    return Run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
