#pragma once

#include <string>

#include "internal/exec/command_result.hpp"
#include "internal/util/deadline.hpp"

namespace edgerun::remote {

struct RemoteTarget {
  std::string user;
  std::string host;

  std::string ToString() const {
    return user.empty() ? host : user + "@" + host;
  }
};

/*
  A conventional remote-shell client (the primary transport).

  Implementations must return once the deadline passes; a run that hit the
  deadline comes back with timed_out set rather than throwing.
*/
class RemoteShell {
 public:
  virtual ~RemoteShell() = default;

  virtual exec::CommandResult Run(const RemoteTarget& target, const std::string& command, util::Deadline deadline) = 0;
};

} // namespace edgerun::remote
