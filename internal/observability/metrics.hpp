#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace beacon::runtime::config {
class RuntimeConfig;
}

namespace beacon::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"beacon"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const beacon::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide instruments. Without ENABLE_OTEL every call is a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // outcome: accepted, replay, or a rejection reason code
  void RecordHeartbeatOutcome(std::string_view outcome);

  // outcome: processed, failed, skipped
  void RecordJobOutcome(std::string_view outcome);
  void ObserveJobDurationMs(double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const beacon::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordHeartbeatOutcome(std::string_view) {
}

inline void Metrics::RecordJobOutcome(std::string_view) {
}

inline void Metrics::ObserveJobDurationMs(double) {
}
#endif

} // namespace beacon::observability
