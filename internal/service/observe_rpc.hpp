#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"

namespace edgerun::service {

/*
  Wraps one RPC body with a span, request metrics and an error log line.
  Exceptions are rethrown unchanged for the transport layer to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view execution_id, Fn&& fn) {
  edgerun::observability::SpanScope span(route);
  if (!execution_id.empty()) {
    span.SetAttribute("execution.id", execution_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       record     = [&](bool success) {
    edgerun::observability::Metrics::Instance().RecordRequest(route, success);
    edgerun::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.MarkFailed(ex.what());
    EDGERUN_LOG_ERROR("RPC failed", {edgerun::observability::StringField("route", route), edgerun::observability::StringField("error", ex.what()),
                                     edgerun::observability::StringField("execution_id", execution_id)});
    record(false);
    throw;
  }
}

} // namespace edgerun::service
