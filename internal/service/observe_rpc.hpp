#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace beacon::service {

// Runs one RPC body, recording success, latency and failures.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view server_id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      beacon::observability::Metrics::Instance().RecordRequest(route, true);
      beacon::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      beacon::observability::Metrics::Instance().RecordRequest(route, true);
      beacon::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    BEACON_LOG_ERROR("RPC failed", {beacon::observability::StringField("route", route), beacon::observability::StringField("error", ex.what()),
                                    beacon::observability::StringField("server_id", server_id)});
    beacon::observability::Metrics::Instance().RecordRequest(route, false);
    beacon::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace beacon::service
