#pragma once

#include <cstdint>

namespace edgerun::model {

enum class ExecutionStatus : std::uint8_t {
  kPending = 0,
  kSuccess = 1,
  kError   = 2,
};

constexpr bool IsTerminal(ExecutionStatus status) {
  return status == ExecutionStatus::kSuccess || status == ExecutionStatus::kError;
}

// Pending -> {Success, Error}, exactly once. Terminal records never move again.
constexpr bool CanTransition(ExecutionStatus from, ExecutionStatus to) {
  return from == ExecutionStatus::kPending && IsTerminal(to);
}

constexpr const char* ToString(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::kPending:
      return "pending";
    case ExecutionStatus::kSuccess:
      return "success";
    case ExecutionStatus::kError:
      return "error";
  }
  return "unknown";
}

} // namespace edgerun::model
