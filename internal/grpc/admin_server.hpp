#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "edgerun/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace edgerun::grpc {

class AdminServer final : public edgerun::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<edgerun::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                     const edgerun::v1::StatsRequest*,
                     edgerun::v1::StatsResponse*) override;

private:
  std::shared_ptr<edgerun::service::AdminService> service_;
};

}
