#pragma once

#include "edgerun/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace edgerun::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  edgerun::v1::StatsResponse Stats(const edgerun::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace edgerun::service
