#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/exec/process_runner.hpp"
#include "internal/remote/remote_shell.hpp"

namespace edgerun::remote {

struct SshOptions {
  std::string binary{"ssh"};
  uint16_t    port{22};
  uint32_t    connect_timeout_s{25};
  uint32_t    server_alive_interval_s{10};
};

/*
  Primary transport: the system OpenSSH client.

  Host-key checking is relaxed because the overlay network already
  authenticates the peer; BatchMode keeps it from ever prompting.
*/
class SshClient final : public RemoteShell {
 public:
  SshClient(SshOptions options, std::shared_ptr<exec::ProcessRunner> runner);

  exec::CommandResult Run(const RemoteTarget& target, const std::string& command, util::Deadline deadline) override;

  std::vector<std::string> BuildArguments(const RemoteTarget& target, const std::string& command) const;

 private:
  SshOptions                           options_;
  std::shared_ptr<exec::ProcessRunner> runner_;
};

} // namespace edgerun::remote
