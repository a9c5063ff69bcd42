#pragma once

#include "edgerun/v1/execution_service.pb.h"
#include "service_context.hpp"

namespace edgerun::service {

class ExecutionService {
 public:
  explicit ExecutionService(ServiceContext ctx);

  edgerun::v1::SubmitExecutionResponse SubmitExecution(const edgerun::v1::SubmitExecutionRequest& req);

  edgerun::v1::GetExecutionStatusResponse GetExecutionStatus(const edgerun::v1::GetExecutionStatusRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace edgerun::service
