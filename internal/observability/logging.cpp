#include "internal/observability/logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <iterator>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/telemetry.hpp"

namespace edgerun::observability {
namespace {

constexpr char kLoggerName[]     = "edgerun-sidecar";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_trace_context{false};

std::string Setting(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool TraceContextSetting(const edgerun::runtime::config::LoggingConfig& logging) {
  const char* value = std::getenv("EDGERUN_LOG_INCLUDE_TRACE_CONTEXT");
  if (!value || !*value) {
    return logging.include_trace_context();
  }
  const std::string flag(value);
  return flag == "1" || flag == "true";
}

bool NeedsQuotes(std::string_view value) {
  return value.empty() || value.find_first_of(" \t\n\"=") != std::string_view::npos;
}

void AppendField(fmt::memory_buffer& line, const LogField& field) {
  if (NeedsQuotes(field.value)) {
    fmt::format_to(std::back_inserter(line), " {}=\"", field.key);
    for (char c : field.value) {
      if (c == '"' || c == '\\') {
        line.push_back('\\');
        line.push_back(c);
      } else if (c == '\n') {
        line.push_back('\\');
        line.push_back('n');
      } else {
        line.push_back(c);
      }
    }
    line.push_back('"');
    return;
  }
  fmt::format_to(std::back_inserter(line), " {}={}", field.key, field.value);
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

void InitializeLogging(const edgerun::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(Setting("EDGERUN_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("EDGERUN_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_trace_context = TraceContextSetting(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  fmt::memory_buffer line;
  line.append(message.data(), message.data() + message.size());
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  if (g_trace_context) {
    const auto trace = ActiveTraceContext();
    if (!trace.empty()) {
      fmt::format_to(std::back_inserter(line), " {}", trace);
    }
  }

  spdlog::log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace edgerun::observability
