#pragma once

#include <string>

namespace edgerun::exec {

/*
  Result of running one external command.

  `output` is stdout and stderr interleaved as the child wrote them.
  `error` describes why the run was not a clean exit 0, empty otherwise.
*/
struct CommandResult {
  int         exit_code{-1};
  std::string output;
  std::string error;
  bool        timed_out{false};

  bool Succeeded() const {
    return !timed_out && exit_code == 0;
  }
};

} // namespace edgerun::exec
