#include "internal/observability/telemetry.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/noop.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>

#include <chrono>
#include <map>
#include <mutex>
#include <utility>

#include "internal/observability/otlp_endpoint.hpp"

namespace edgerun::observability {

namespace nostd       = opentelemetry::nostd;
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using Attributes = std::initializer_list<std::pair<nostd::string_view, opentelemetry::common::AttributeValue>>;

constexpr std::chrono::milliseconds kDefaultExportInterval{1000};

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpEndpoint& endpoint) {
  if (endpoint.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint.address;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint.address;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

nostd::string_view View(std::string_view text) {
  return {text.data(), text.size()};
}

} // namespace

bool InitializeMetrics(const edgerun::runtime::config::RuntimeConfig& config) {
  ShutdownMetrics();
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      observability.metrics_export_interval_ms() > 0 ? std::chrono::milliseconds(observability.metrics_export_interval_ms()) : kDefaultExportInterval;

  const auto endpoint = ResolveOtlpEndpoint(observability, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");
  g_provider          = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), SidecarResource());
  g_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(endpoint), reader_options));
  metrics_api::Provider::SetMeterProvider(nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  EDGERUN_LOG_INFO("Metric export enabled", {StringField("endpoint", endpoint.address), BoolField("http", endpoint.http)});
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) {
    return;
  }
  metrics_api::Provider::SetMeterProvider(nostd::shared_ptr<metrics_api::MeterProvider>(new metrics_api::NoopMeterProvider()));
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

/*
  Instruments are bound to whichever meter provider is installed when the
  singleton is first used, so InitializeMetrics must run before any RPC or
  execution is served.
*/
struct Metrics::Impl {
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  nostd::shared_ptr<metrics_api::Histogram<double>>      execution_duration_ms;
  nostd::shared_ptr<metrics_api::ObservableInstrument>   records;

  // Last published record count per status, read by the gauge callback.
  std::mutex                          records_mutex;
  std::map<std::string, std::int64_t> records_by_status;

  static void ObserveRecords(metrics_api::ObserverResult result, void* state) {
    auto*           impl  = static_cast<Impl*>(state);
    auto            gauge = nostd::get<nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
    std::lock_guard lock(impl->records_mutex);
    for (const auto& [status, count] : impl->records_by_status) {
      gauge->Observe(count, Attributes{{"status", View(status)}});
    }
  }
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("edgerun-sidecar", "0.1.0");

  impl_->requests              = meter->CreateUInt64Counter("edgerun.rpc.requests", "RPCs served, by route and outcome", "1");
  impl_->request_latency_ms    = meter->CreateDoubleHistogram("edgerun.rpc.latency_ms", "RPC handling time", "ms");
  impl_->execution_duration_ms = meter->CreateDoubleHistogram("edgerun.execution.duration_ms", "Dispatch-to-completion time of one execution", "ms");
  impl_->records               = meter->CreateInt64ObservableGauge("edgerun.execution.records", "Execution records held in memory, by status", "1");
  impl_->records->AddCallback(&Impl::ObserveRecords, impl_.get());
}

Metrics::~Metrics() {
  impl_->records->RemoveCallback(&Impl::ObserveRecords, impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  impl_->requests->Add(std::uint64_t{1}, Attributes{{"route", View(route)}, {"success", success}}, opentelemetry::context::Context{});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  impl_->request_latency_ms->Record(latency_ms, Attributes{{"route", View(route)}}, opentelemetry::context::Context{});
}

void Metrics::ObserveExecutionDurationMs(std::string_view transport, bool success, double duration_ms) {
  impl_->execution_duration_ms->Record(duration_ms, Attributes{{"transport", View(transport)}, {"success", success}}, opentelemetry::context::Context{});
}

void Metrics::SetExecutionRecords(std::string_view status, std::uint64_t count) {
  std::lock_guard lock(impl_->records_mutex);
  impl_->records_by_status[std::string(status)] = static_cast<std::int64_t>(count);
}

} // namespace edgerun::observability

#else

namespace edgerun::observability {

bool InitializeMetrics(const edgerun::runtime::config::RuntimeConfig& config) {
  if (config.observability().metrics_enabled()) {
    EDGERUN_LOG_WARN("Metrics requested but this build has no OpenTelemetry support");
  }
  return false;
}

void ShutdownMetrics() {
}

struct Metrics::Impl {};

Metrics::Metrics()  = default;
Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view, bool) {
}

void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

void Metrics::ObserveExecutionDurationMs(std::string_view, bool, double) {
}

void Metrics::SetExecutionRecords(std::string_view, std::uint64_t) {
}

} // namespace edgerun::observability

#endif
