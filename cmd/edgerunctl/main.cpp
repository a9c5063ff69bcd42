#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <string>

#include "edgerun/v1.hpp"

using namespace edgerun::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  edgerunctl <addr> submit <device_id> -- <command...>\n"
            << "  edgerunctl <addr> deploy <device_id> <app_type> <app_reference>\n"
            << "  edgerunctl <addr> status <execution_id>\n"
            << "  edgerunctl <addr> ready\n"
            << "  edgerunctl <addr> stats\n";
}

static const char* StatusName(ExecutionStatus status) {
  switch (status) {
    case EXECUTION_STATUS_PENDING:
      return "pending";
    case EXECUTION_STATUS_SUCCESS:
      return "success";
    case EXECUTION_STATUS_ERROR:
      return "error";
    default:
      return "unspecified";
  }
}

static const char* TransportName(Transport transport) {
  switch (transport) {
    case TRANSPORT_PRIMARY:
      return "primary";
    case TRANSPORT_SECONDARY:
      return "secondary";
    default:
      return "none";
  }
}

static int Submit(ExecutionService::Stub& stub, const SubmitExecutionRequest& req) {
  grpc::ClientContext     ctx;
  SubmitExecutionResponse resp;

  auto status = stub.SubmitExecution(&ctx, req, &resp);

  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  std::cout << "execution_id=" << resp.execution_id() << "\n";
  std::cout << "status=" << resp.status() << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto execution_stub = ExecutionService::NewStub(channel);
  auto health_stub    = HealthService::NewStub(channel);
  auto admin_stub     = AdminService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "submit") {
    // submit <device> -- <cmd...>
    if (argc < 6 || std::string(argv[4]) != "--") {
      Usage();
      return 1;
    }

    SubmitExecutionRequest req;
    req.set_device_id(argv[3]);
    for (int i = 5; i < argc; ++i) {
      req.mutable_command()->add_args(argv[i]);
    }
    return Submit(*execution_stub, req);
  }

  // ------------------------------------------------------------

  if (cmd == "deploy") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    SubmitExecutionRequest req;
    req.set_device_id(argv[3]);
    req.mutable_deployment()->set_app_type(argv[4]);
    req.mutable_deployment()->set_app_reference(argv[5]);
    return Submit(*execution_stub, req);
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    grpc::ClientContext        ctx;
    GetExecutionStatusRequest  req;
    GetExecutionStatusResponse resp;
    req.set_execution_id(argv[3]);

    auto status = execution_stub->GetExecutionStatus(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    const auto& record = resp.record();
    std::cout << "execution_id=" << record.execution_id() << "\n";
    std::cout << "device_id=" << record.device_id() << "\n";
    std::cout << "status=" << StatusName(record.status()) << "\n";
    std::cout << "transport=" << TransportName(record.transport()) << "\n";
    std::cout << "command=" << record.command_line() << "\n";
    if (!record.error().empty()) {
      std::cout << "error=" << record.error() << "\n";
    }
    if (!record.output().empty()) {
      std::cout << "output:\n" << record.output();
      if (record.output().back() != '\n') std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ready") {
    grpc::ClientContext  ctx;
    GetReadinessRequest  req;
    GetReadinessResponse resp;

    auto status = health_stub->GetReadiness(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "status=" << resp.status() << "\n";
    std::cout << "version=" << resp.version() << "\n";
    std::cout << "overlay_ready=" << (resp.overlay_ready() ? "true" : "false") << "\n";
    std::cout << "message=" << resp.message() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    grpc::ClientContext ctx;
    StatsRequest        req;
    StatsResponse       resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "total=" << resp.executions_total() << "\n";
    std::cout << "pending=" << resp.pending() << "\n";
    std::cout << "succeeded=" << resp.succeeded() << "\n";
    std::cout << "failed=" << resp.failed() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
