#include "internal/observability/telemetry.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/scope.h>

#include <utility>

#include "internal/observability/otlp_endpoint.hpp"

namespace edgerun::observability {

namespace nostd     = opentelemetry::nostd;
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider> g_provider;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpEndpoint& endpoint) {
  if (endpoint.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint.address;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  // The sidecar exports to a collector on the same host.
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint.address;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

nostd::shared_ptr<trace_api::Tracer> SidecarTracer() {
  return trace_api::Provider::GetTracerProvider()->GetTracer("edgerun-sidecar", "0.1.0");
}

} // namespace

bool InitializeTracing(const edgerun::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  const auto endpoint  = ResolveOtlpEndpoint(config.observability(), "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "/v1/traces");
  auto       processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(endpoint), sdktrace::BatchSpanProcessorOptions{});
  g_provider           = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), SidecarResource()));
  trace_api::Provider::SetTracerProvider(nostd::shared_ptr<trace_api::TracerProvider>(g_provider));

  EDGERUN_LOG_INFO("Trace export enabled", {StringField("endpoint", endpoint.address), BoolField("http", endpoint.http)});
  return true;
}

void ShutdownTracing() {
  if (!g_provider) {
    return;
  }
  trace_api::Provider::SetTracerProvider(nostd::shared_ptr<trace_api::TracerProvider>(new trace_api::NoopTracerProvider()));
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

std::string ActiveTraceContext() {
  const auto span    = trace_api::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  char trace_id[2 * trace_api::TraceId::kSize];
  char span_id[2 * trace_api::SpanId::kSize];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  return "trace_id=" + std::string(trace_id, sizeof(trace_id)) + " span_id=" + std::string(span_id, sizeof(span_id));
}

struct SpanScope::Impl {
  explicit Impl(nostd::shared_ptr<trace_api::Span> started) : span(std::move(started)), scope(span) {
  }

  nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                   scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>(SidecarTracer()->StartSpan(nostd::string_view(name.data(), name.size())))) {
}

SpanScope::~SpanScope() {
  impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  impl_->span->SetAttribute(nostd::string_view(key.data(), key.size()), nostd::string_view(value.data(), value.size()));
}

void SpanScope::MarkFailed(std::string_view error) {
  impl_->span->SetStatus(trace_api::StatusCode::kError, nostd::string_view(error.data(), error.size()));
}

} // namespace edgerun::observability

#else

namespace edgerun::observability {

bool InitializeTracing(const edgerun::runtime::config::RuntimeConfig& config) {
  if (config.observability().tracing_enabled()) {
    EDGERUN_LOG_WARN("Tracing requested but this build has no OpenTelemetry support");
  }
  return false;
}

void ShutdownTracing() {
}

std::string ActiveTraceContext() {
  return {};
}

struct SpanScope::Impl {};

SpanScope::SpanScope(std::string_view) {
}

SpanScope::~SpanScope() = default;

void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

void SpanScope::MarkFailed(std::string_view) {
}

} // namespace edgerun::observability

#endif
