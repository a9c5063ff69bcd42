#include "internal/observability/logging.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/telemetry.hpp"

namespace {

using namespace edgerun::observability;

// Routes the default logger into a string, one bare message per line.
struct CapturedLog {
  CapturedLog() {
    auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
    auto logger = std::make_shared<spdlog::logger>("capture", sink);
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(logger);
  }

  ~CapturedLog() {
    spdlog::default_logger()->sinks().clear();
  }

  std::string Text() const {
    return stream.str();
  }

  std::ostringstream stream;
};

void TestFieldsAreAppendedInOrder() {
  CapturedLog log;
  EDGERUN_LOG_INFO("Execution succeeded",
                   {StringField("execution_id", "exec-edge-01-1"), IntField("exit_code", 0), BoolField("overlay_ready", true),
                    DurationField("elapsed", std::chrono::milliseconds(42))});

  assert(log.Text() == "Execution succeeded execution_id=exec-edge-01-1 exit_code=0 overlay_ready=true elapsed=42ms\n");
}

void TestValuesWithSpacesAreQuoted() {
  CapturedLog log;
  EDGERUN_LOG_WARN("Primary transport failed", {StringField("error", "exit status 255"), StringField("output", "say \"hi\"\nbye"), StringField("empty", "")});

  assert(log.Text() == "Primary transport failed error=\"exit status 255\" output=\"say \\\"hi\\\"\\nbye\" empty=\"\"\n");
}

void TestLevelFilterDropsLine() {
  CapturedLog log;
  EDGERUN_LOG_DEBUG("Executor chain transition", {StringField("to", "primary_attempted")});
  assert(log.Text().empty());
}

void TestInitializeReadsLevelFromEnvironmentFirst() {
  edgerun::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("error");

  ::setenv("EDGERUN_LOG_LEVEL", "debug", 1);
  InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  ::unsetenv("EDGERUN_LOG_LEVEL");
  InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::err);
}

void TestTraceContextIsEmptyWithoutActiveSpan() {
  assert(ActiveTraceContext().empty());
}

} // namespace

int main() {
  TestFieldsAreAppendedInOrder();
  TestValuesWithSpacesAreQuoted();
  TestLevelFilterDropsLine();
  TestInitializeReadsLevelFromEnvironmentFirst();
  TestTraceContextIsEmptyWithoutActiveSpan();

  std::cout << "edgerun_unit_logging: pass\n";
  return 0;
}
