#include "health_server.hpp"

#include "grpc_error.hpp"
#include "edgerun/v1.hpp"

namespace edgerun::grpc {

HealthServer::HealthServer(std::shared_ptr<edgerun::service::HealthService> svc) : service_(std::move(svc)) {
}

::grpc::Status HealthServer::GetReadiness(::grpc::ServerContext*, const edgerun::v1::GetReadinessRequest* req, edgerun::v1::GetReadinessResponse* resp) {
  try {
    *resp = service_->GetReadiness(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace edgerun::grpc
