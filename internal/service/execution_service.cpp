#include "execution_service.hpp"

#include <utility>

#include "internal/dispatch/dispatcher.hpp"
#include "internal/model/execution.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "edgerun/v1.hpp"
#include "observe_rpc.hpp"

namespace edgerun::service {

using namespace edgerun::v1;

namespace {

model::ExecutionRequest FromProto(const SubmitExecutionRequest& req) {
  model::ExecutionRequest request;
  request.device_id = req.device_id();

  switch (req.intent_case()) {
    case SubmitExecutionRequest::kCommand:
      request.command.assign(req.command().args().begin(), req.command().args().end());
      break;
    case SubmitExecutionRequest::kDeployment:
      request.deployment = model::DeploymentIntent{req.deployment().app_type(), req.deployment().app_reference()};
      break;
    case SubmitExecutionRequest::INTENT_NOT_SET:
      break;
  }
  return request;
}

ExecutionStatus ToProto(model::ExecutionStatus status) {
  switch (status) {
    case model::ExecutionStatus::kPending:
      return EXECUTION_STATUS_PENDING;
    case model::ExecutionStatus::kSuccess:
      return EXECUTION_STATUS_SUCCESS;
    case model::ExecutionStatus::kError:
      return EXECUTION_STATUS_ERROR;
  }
  return EXECUTION_STATUS_UNSPECIFIED;
}

Transport ToProto(model::Transport transport) {
  switch (transport) {
    case model::Transport::kNone:
      return TRANSPORT_NONE;
    case model::Transport::kPrimary:
      return TRANSPORT_PRIMARY;
    case model::Transport::kSecondary:
      return TRANSPORT_SECONDARY;
  }
  return TRANSPORT_NONE;
}

ErrorKind ToProto(model::ErrorKind kind) {
  switch (kind) {
    case model::ErrorKind::kNone:
      return ERROR_KIND_NONE;
    case model::ErrorKind::kNetworkUninitialized:
      return ERROR_KIND_NETWORK_UNINITIALIZED;
    case model::ErrorKind::kExecutionFailure:
      return ERROR_KIND_EXECUTION_FAILURE;
    case model::ErrorKind::kDeadlineExceeded:
      return ERROR_KIND_DEADLINE_EXCEEDED;
  }
  return ERROR_KIND_NONE;
}

void ToProto(const model::ExecutionRecord& record, ExecutionRecord* out) {
  out->set_execution_id(record.execution_id);
  out->set_device_id(record.device_id);
  out->set_status(ToProto(record.status));
  out->set_output(record.output);
  out->set_error(record.error);
  out->set_command_line(record.command_line);
  out->set_transport(ToProto(record.transport));
  out->set_error_kind(ToProto(record.error_kind));
  *out->mutable_created_at() = util::ToProto(record.created_at);
  if (record.completed_at) {
    *out->mutable_completed_at() = util::ToProto(*record.completed_at);
  }
}

} // namespace

ExecutionService::ExecutionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitExecutionResponse ExecutionService::SubmitExecution(const SubmitExecutionRequest& req) {
  return ObserveRpc("ExecutionService.SubmitExecution", {}, [&] {
    const auto id = ctx_.dispatcher->Dispatch(FromProto(req));

    SubmitExecutionResponse resp;
    resp.set_execution_id(id);
    resp.set_status("accepted");
    resp.set_message("Command dispatched");
    return resp;
  });
}

GetExecutionStatusResponse ExecutionService::GetExecutionStatus(const GetExecutionStatusRequest& req) {
  return ObserveRpc("ExecutionService.GetExecutionStatus", req.execution_id(), [&] {
    if (req.execution_id().empty()) {
      throw util::ValidationError("execution_id required");
    }

    GetExecutionStatusResponse resp;
    ToProto(ctx_.dispatcher->GetStatus(req.execution_id()), resp.mutable_record());
    resp.set_message("ok");
    return resp;
  });
}

} // namespace edgerun::service
