#include "command_builder.hpp"

namespace edgerun::remote {

namespace {

constexpr char kDeployVerb[] = "deploy";

std::string JoinArguments(const std::vector<std::string>& args) {
  std::string line;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      line.push_back(' ');
    }
    line += args[i];
  }
  return line;
}

} // namespace

std::string BuildDeployCommand(const model::DeploymentIntent& intent, const CommandBuilderOptions& options) {
  return "docker pull " + intent.app_reference + " && docker run -d --name " + intent.app_type + "-instance --restart=" + options.restart_policy +
         " " + intent.app_reference;
}

std::string BuildCommandLine(const model::ExecutionRequest& request, const CommandBuilderOptions& options) {
  if (request.deployment && request.deployment->Complete()) {
    return BuildDeployCommand(*request.deployment, options);
  }

  const auto& command = request.command;
  if (command.empty()) {
    return kUnrecognizedCommand;
  }

  // The upstream gateway encodes deployments as ["deploy", type, ref, <config json>].
  if (command.size() >= 3 && command[0] == kDeployVerb) {
    model::DeploymentIntent intent{command[1], command[2]};
    if (intent.Complete()) {
      return BuildDeployCommand(intent, options);
    }
  }

  return JoinArguments(command);
}

} // namespace edgerun::remote
