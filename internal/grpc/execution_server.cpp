#include "execution_server.hpp"

#include "grpc_error.hpp"
#include "edgerun/v1.hpp"

namespace edgerun::grpc {

ExecutionServer::ExecutionServer(std::shared_ptr<edgerun::service::ExecutionService> svc) : service_(std::move(svc)) {
}

::grpc::Status ExecutionServer::SubmitExecution(::grpc::ServerContext*, const edgerun::v1::SubmitExecutionRequest* req,
                                                edgerun::v1::SubmitExecutionResponse* resp) {
  try {
    *resp = service_->SubmitExecution(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ExecutionServer::GetExecutionStatus(::grpc::ServerContext*, const edgerun::v1::GetExecutionStatusRequest* req,
                                                   edgerun::v1::GetExecutionStatusResponse* resp) {
  try {
    *resp = service_->GetExecutionStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace edgerun::grpc
