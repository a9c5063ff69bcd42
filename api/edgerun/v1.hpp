#pragma once

#include "edgerun/v1/execution.pb.h"

#include "edgerun/v1/admin_service.pb.h"
#include "edgerun/v1/execution_service.pb.h"
#include "edgerun/v1/health_service.pb.h"

#include "edgerun/v1/admin_service.grpc.pb.h"
#include "edgerun/v1/execution_service.grpc.pb.h"
#include "edgerun/v1/health_service.grpc.pb.h"
