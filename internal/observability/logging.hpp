#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace edgerun::runtime::config {
class RuntimeConfig;
}

namespace edgerun::observability {

// One `key=value` pair appended to a log line. Values with spaces are quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

/*
  Installs the process logger. Each setting is taken from the environment
  first, then from the `logging` config section:

    EDGERUN_LOG_LEVEL                  level
    EDGERUN_LOG_PATTERN                pattern
    EDGERUN_LOG_INCLUDE_TRACE_CONTEXT  include_trace_context
*/
void InitializeLogging(const edgerun::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace edgerun::observability

#define EDGERUN_LOG_DEBUG(message, ...) ::edgerun::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define EDGERUN_LOG_INFO(message, ...) ::edgerun::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define EDGERUN_LOG_WARN(message, ...) ::edgerun::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define EDGERUN_LOG_ERROR(message, ...) ::edgerun::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
