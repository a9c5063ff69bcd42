#pragma once

#include <opentelemetry/sdk/resource/resource.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace edgerun::observability {

struct OtlpEndpoint {
  std::string address;
  bool        http{false};
};

/*
  Where one signal is exported. Order: `otlp_endpoint` from config, the
  signal's own OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, the generic
  OTEL_EXPORTER_OTLP_ENDPOINT (HTTP gets the signal path appended), then a
  collector on localhost.
*/
inline OtlpEndpoint ResolveOtlpEndpoint(const edgerun::runtime::config::ObservabilityConfig& config, const char* signal_env, const char* http_path) {
  OtlpEndpoint endpoint;
  endpoint.http = config.transport() == edgerun::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    endpoint.address = config.otlp_endpoint();
  } else if (const char* signal = std::getenv(signal_env); signal && *signal) {
    endpoint.address = signal;
  } else if (const char* base = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); base && *base) {
    endpoint.address = endpoint.http ? std::string(base) + http_path : std::string(base);
  } else {
    endpoint.address = endpoint.http ? std::string("http://localhost:4318") + http_path : std::string("localhost:4317");
  }
  return endpoint;
}

inline opentelemetry::sdk::resource::Resource SidecarResource() {
  return opentelemetry::sdk::resource::Resource::Create({{"service.name", "edgerun-sidecar"}, {"service.version", "0.1.0"}});
}

} // namespace edgerun::observability
