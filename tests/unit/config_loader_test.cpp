#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "beacon_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullDocument() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/beacon/beacon.db"
    busy_timeout_ms: 2500
ingest:
  default_grace_seconds: 300
  min_grace_seconds: 30
  max_grace_seconds: 1800
  enforce_timestamp_window: false
  max_future_skew_seconds: 15
  min_agent_version: "1.5.0"
  denied_server_ids: ["srv-a", "srv-b"]
  record_rejections: true
worker:
  enabled: false
  poll_interval_ms: 250
  batch_size: 10
  history_limit: 100
  claim_ttl_seconds: 30
  max_attempts: 5
  error_backoff_ms: 1000
engines:
  uptime_window_hours: 12
  anomaly_decay_minutes: 15
  default_capacity: 32
key_cache:
  ttl_seconds: 20
  max_stale_seconds: 120
logging:
  level: debug
observability:
  metrics_enabled: true
  otlp_endpoint: "localhost:4317"
  transport: OTLP_TRANSPORT_GRPC
  service_name: beacon
)");

  auto config = beacon::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");

  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/beacon/beacon.db");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);

  assert(config.ingest().default_grace_seconds() == 300);
  assert(config.ingest().has_enforce_timestamp_window());
  assert(!config.ingest().enforce_timestamp_window());
  assert(config.ingest().max_future_skew_seconds() == 15);
  assert(config.ingest().min_agent_version() == "1.5.0");
  assert(config.ingest().denied_server_ids_size() == 2);
  assert(config.ingest().denied_server_ids(1) == "srv-b");

  assert(config.worker().has_enabled());
  assert(!config.worker().enabled());
  assert(config.worker().batch_size() == 10);
  assert(config.worker().max_attempts() == 5);

  assert(config.engines().anomaly_decay_minutes() == 15);
  assert(config.key_cache().max_stale_seconds() == 120);
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == beacon::runtime::config::OTLP_TRANSPORT_GRPC);
}

void TestEmptyDocumentTakesDefaults() {
  auto config = beacon::config::ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address().empty());
  assert(config.database().backend_case() == beacon::runtime::config::DatabaseConfig::BACKEND_NOT_SET);
  assert(!config.worker().has_enabled());
  assert(!config.ingest().has_record_rejections());
}

void TestMemoryBackend() {
  auto config = beacon::config::ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");
  assert(config.database().has_memory());
}

void TestQuotedScalarsStayStrings() {
  auto config = beacon::config::ConfigLoader::LoadFromYamlString(R"(ingest:
  min_agent_version: "2.0"
logging:
  level: "true"
)");
  assert(config.ingest().min_agent_version() == "2.0");
  assert(config.logging().level() == "true");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\beacon\\\"quoted\"\\db.sqlite"
)");

  auto config = beacon::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\beacon\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = beacon::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)beacon::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown fields.");

  threw = false;
  try {
    (void)beacon::config::ConfigLoader::LoadFromYamlString("worker:\n  batch_sise: 5\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)beacon::config::ConfigLoader::LoadFromYaml("/nonexistent/beacon/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestShippedExampleLoads() {
  auto config = beacon::config::ConfigLoader::LoadFromYaml(BEACON_SOURCE_DIR "/config/beacon.example.yaml");
  assert(!config.server().bind_address().empty());
}

} // namespace

int main() {
  TestFullDocument();
  TestEmptyDocumentTakesDefaults();
  TestMemoryBackend();
  TestQuotedScalarsStayStrings();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMissingFileThrows();
  TestShippedExampleLoads();

  std::cout << "beacon_unit_config_loader: pass\n";
  return 0;
}
