#include "remote/service.hpp"

#include <map>
#include <stdexcept>
#include <string>

#include "glog/logging.h"
#include "policy/config.hpp"

namespace remote {

namespace {
const int kDefaultHistoryLimit = 100;
}  // namespace

grpc::Status SandboxServiceImpl::CreateSandbox(
    grpc::ServerContext* /*context*/, const proto::CreateSandboxRequest* request,
    proto::CreateSandboxResponse* response) {
  if (request->tenant_id().empty())
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "tenant_id is required");
  try {
    response->set_instance_id(manager_->Create(
        request->tenant_id(),
        policy::SandboxConfig::FromProto(request->config())));
    return grpc::Status::OK;
  } catch (const std::invalid_argument& e) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  } catch (const std::exception& e) {
    LOG(ERROR) << "CreateSandbox: " << e.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
}

grpc::Status SandboxServiceImpl::ExecuteCode(
    grpc::ServerContext* /*context*/, const proto::ExecuteCodeRequest* request,
    proto::ExecutionResult* response) {
  std::map<std::string, proto::Value> context(request->context().begin(),
                                              request->context().end());
  try {
    *response =
        manager_->Execute(request->instance_id(), request->source(), context);
    return grpc::Status::OK;
  } catch (const manager::not_found& e) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, e.what());
  } catch (const std::exception& e) {
    LOG(ERROR) << "ExecuteCode: " << e.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
}

grpc::Status SandboxServiceImpl::GetState(grpc::ServerContext* /*context*/,
                                          const proto::GetStateRequest* request,
                                          proto::InstanceState* response) {
  try {
    *response = manager_->Inspect(request->instance_id());
    return grpc::Status::OK;
  } catch (const manager::not_found& e) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, e.what());
  }
}

grpc::Status SandboxServiceImpl::Cleanup(grpc::ServerContext* /*context*/,
                                         const proto::CleanupRequest* request,
                                         proto::CleanupResponse* response) {
  response->set_removed(manager_->Cleanup(request->instance_id()));
  return grpc::Status::OK;
}

grpc::Status SandboxServiceImpl::GetHistory(
    grpc::ServerContext* /*context*/, const proto::GetHistoryRequest* request,
    proto::GetHistoryResponse* response) {
  int limit = request->limit() > 0 ? request->limit() : kDefaultHistoryLimit;
  for (proto::ExecutionResult& result :
       manager_->History(request->instance_id(), limit))
    *response->add_result() = std::move(result);
  return grpc::Status::OK;
}

grpc::Status SandboxServiceImpl::GetMetrics(
    grpc::ServerContext* /*context*/, const proto::GetMetricsRequest* /*request*/,
    proto::MetricsSnapshot* response) {
  *response = manager_->Metrics();
  return grpc::Status::OK;
}

}  // namespace remote
