#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "edgerun/v1.hpp"

namespace edgerun::grpc {

AdminServer::AdminServer(std::shared_ptr<edgerun::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const edgerun::v1::StatsRequest* req, edgerun::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace edgerun::grpc
