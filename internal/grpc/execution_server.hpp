#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "edgerun/v1/execution_service.grpc.pb.h"
#include "internal/service/execution_service.hpp"

namespace edgerun::grpc {

class ExecutionServer final : public edgerun::v1::ExecutionService::Service {
public:
  explicit ExecutionServer(std::shared_ptr<edgerun::service::ExecutionService> svc);

  ::grpc::Status SubmitExecution(::grpc::ServerContext*,
                                 const edgerun::v1::SubmitExecutionRequest*,
                                 edgerun::v1::SubmitExecutionResponse*) override;

  ::grpc::Status GetExecutionStatus(::grpc::ServerContext*,
                                    const edgerun::v1::GetExecutionStatusRequest*,
                                    edgerun::v1::GetExecutionStatusResponse*) override;

private:
  std::shared_ptr<edgerun::service::ExecutionService> service_;
};

}
