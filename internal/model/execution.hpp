#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace edgerun::model {

struct DeploymentIntent {
  std::string app_type;
  std::string app_reference;

  bool Complete() const {
    return !app_type.empty() && !app_reference.empty();
  }
};

/*
  What a caller asked to run on a device.

  Exactly one of `command` (non-empty) or `deployment` is expected;
  the dispatcher enforces that before anything is stored.
*/
struct ExecutionRequest {
  std::string                     device_id;
  std::vector<std::string>        command;
  std::optional<DeploymentIntent> deployment;
};

enum class Transport : std::uint8_t {
  kNone      = 0,
  kPrimary   = 1,
  kSecondary = 2,
};

enum class ErrorKind : std::uint8_t {
  kNone                 = 0,
  kNetworkUninitialized = 1,
  kExecutionFailure     = 2,
  kDeadlineExceeded     = 3,
};

constexpr const char* ToString(Transport transport) {
  switch (transport) {
    case Transport::kNone:
      return "none";
    case Transport::kPrimary:
      return "primary";
    case Transport::kSecondary:
      return "secondary";
  }
  return "unknown";
}

constexpr const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kNetworkUninitialized:
      return "network_uninitialized";
    case ErrorKind::kExecutionFailure:
      return "execution_failure";
    case ErrorKind::kDeadlineExceeded:
      return "deadline_exceeded";
  }
  return "unknown";
}

// Terminal result produced by the executor chain.
struct ExecutionOutcome {
  ExecutionStatus status{ExecutionStatus::kError};
  std::string     output;
  std::string     error;
  Transport       transport{Transport::kNone};
  ErrorKind       error_kind{ErrorKind::kNone};
};

struct ExecutionRecord {
  std::string     execution_id;
  std::string     device_id;
  std::string     command_line;
  ExecutionStatus status{ExecutionStatus::kPending};
  std::string     output;
  std::string     error;
  Transport       transport{Transport::kNone};
  ErrorKind       error_kind{ErrorKind::kNone};

  util::TimePoint                created_at{};
  std::optional<util::TimePoint> completed_at;
};

} // namespace edgerun::model
