#include "internal/remote/command_builder.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using edgerun::model::DeploymentIntent;
using edgerun::model::ExecutionRequest;
using edgerun::remote::BuildCommandLine;
using edgerun::remote::CommandBuilderOptions;

ExecutionRequest Deployment(const std::string& app_type, const std::string& app_reference) {
  ExecutionRequest request;
  request.device_id  = "device-a";
  request.deployment = DeploymentIntent{app_type, app_reference};
  return request;
}

ExecutionRequest Command(std::vector<std::string> args) {
  ExecutionRequest request;
  request.device_id = "device-a";
  request.command   = std::move(args);
  return request;
}

void TestDeploymentIntentBuildsPullAndRun() {
  const auto line = BuildCommandLine(Deployment("zed", "dummy-zed:latest"));
  assert(line == "docker pull dummy-zed:latest && docker run -d --name zed-instance --restart=unless-stopped dummy-zed:latest");
}

void TestRestartPolicyIsConfigurable() {
  CommandBuilderOptions options;
  options.restart_policy = "always";

  const auto line = BuildCommandLine(Deployment("web", "nginx:1.27"), options);
  assert(line == "docker pull nginx:1.27 && docker run -d --name web-instance --restart=always nginx:1.27");
}

void TestGatewayDeployArgvIsTreatedAsDeployment() {
  const auto line = BuildCommandLine(Command({"deploy", "zed", "dummy-zed:latest", R"({"env":"prod"})"}));
  assert(line == "docker pull dummy-zed:latest && docker run -d --name zed-instance --restart=unless-stopped dummy-zed:latest");
}

void TestRawCommandIsJoinedWithSpaces() {
  assert(BuildCommandLine(Command({"uname", "-a"})) == "uname -a");
  assert(BuildCommandLine(Command({"echo", "two  spaces"})) == "echo two  spaces");
}

void TestShortDeployArgvFallsBackToJoin() {
  assert(BuildCommandLine(Command({"deploy", "zed"})) == "deploy zed");
  assert(BuildCommandLine(Command({"deploy", "", "ref"})) == "deploy  ref");
}

void TestNothingRunnableYieldsDiagnosticNoOp() {
  ExecutionRequest empty;
  empty.device_id = "device-a";
  assert(BuildCommandLine(empty) == "echo 'deployment command not recognized'");

  assert(BuildCommandLine(Deployment("zed", "")) == edgerun::remote::kUnrecognizedCommand);
}

} // namespace

int main() {
  TestDeploymentIntentBuildsPullAndRun();
  TestRestartPolicyIsConfigurable();
  TestGatewayDeployArgvIsTreatedAsDeployment();
  TestRawCommandIsJoinedWithSpaces();
  TestShortDeployArgvFallsBackToJoin();
  TestNothingRunnableYieldsDiagnosticNoOp();

  std::cout << "edgerun_unit_command_builder: pass\n";
  return 0;
}
