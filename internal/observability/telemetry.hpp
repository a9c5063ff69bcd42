#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace edgerun::runtime::config {
class RuntimeConfig;
}

namespace edgerun::observability {

/*
  OTLP export of spans and metrics, switched on by the `observability`
  config section. Builds without ENABLE_OTEL keep the same API and record
  nothing.

  Initialize* return whether an exporter was installed.
*/
bool InitializeTracing(const edgerun::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const edgerun::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// "trace_id=<hex> span_id=<hex>" of the span active on this thread, or empty.
std::string ActiveTraceContext();

// Span for the current scope, made active for its lifetime.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void MarkFailed(std::string_view error);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

class Metrics {
 public:
  static Metrics& Instance();

  // RPC layer.
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // Dispatcher.
  void ObserveExecutionDurationMs(std::string_view transport, bool success, double duration_ms);
  void SetExecutionRecords(std::string_view status, std::uint64_t count);

 private:
  Metrics();
  ~Metrics();

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace edgerun::observability
