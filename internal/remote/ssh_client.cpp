#include "ssh_client.hpp"

#include <utility>

namespace edgerun::remote {

SshClient::SshClient(SshOptions options, std::shared_ptr<exec::ProcessRunner> runner)
    : options_(std::move(options)), runner_(std::move(runner)) {
}

std::vector<std::string> SshClient::BuildArguments(const RemoteTarget& target, const std::string& command) const {
  std::vector<std::string> args{
      options_.binary,
      "-o",
      "StrictHostKeyChecking=no",
      "-o",
      "UserKnownHostsFile=/dev/null",
      "-o",
      "ConnectTimeout=" + std::to_string(options_.connect_timeout_s),
      "-o",
      "ServerAliveInterval=" + std::to_string(options_.server_alive_interval_s),
      "-o",
      "BatchMode=yes",
  };
  if (options_.port != 22) {
    args.push_back("-p");
    args.push_back(std::to_string(options_.port));
  }
  args.push_back(target.ToString());
  args.push_back(command);
  return args;
}

exec::CommandResult SshClient::Run(const RemoteTarget& target, const std::string& command, util::Deadline deadline) {
  return runner_->Run(BuildArguments(target, command), deadline);
}

} // namespace edgerun::remote
