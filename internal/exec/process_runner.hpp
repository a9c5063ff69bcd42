#pragma once

#include <string>
#include <vector>

#include "internal/exec/command_result.hpp"
#include "internal/util/deadline.hpp"

namespace edgerun::exec {

/*
  Runs an executable (argv[0] looked up on PATH, no shell) and captures
  combined output.

  The child gets its own process group; when the deadline passes the whole
  group is killed and the result is marked timed_out.

  Throws util::ExecutionFailure if the child cannot be started at all.
*/
class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;

  virtual CommandResult Run(const std::vector<std::string>& argv, util::Deadline deadline);
};

} // namespace edgerun::exec
