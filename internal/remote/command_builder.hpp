#pragma once

#include <string>

#include "internal/model/execution.hpp"

namespace edgerun::remote {

// Diagnostic no-op sent when a request carries nothing runnable.
inline constexpr char kUnrecognizedCommand[] = "echo 'deployment command not recognized'";

inline constexpr char kDefaultRestartPolicy[] = "unless-stopped";

struct CommandBuilderOptions {
  std::string restart_policy{kDefaultRestartPolicy};
};

/*
  Pure translation of a request into the single shell line run on the device.

    deployment intent          -> docker pull <ref> && docker run -d --name <type>-instance --restart=<policy> <ref>
    ["deploy", type, ref, ...] -> same as a deployment intent
    any other non-empty argv   -> elements joined by single spaces
    otherwise                  -> kUnrecognizedCommand
*/
std::string BuildCommandLine(const model::ExecutionRequest& request, const CommandBuilderOptions& options = {});

std::string BuildDeployCommand(const model::DeploymentIntent& intent, const CommandBuilderOptions& options = {});

} // namespace edgerun::remote
