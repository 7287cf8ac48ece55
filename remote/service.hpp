#ifndef REMOTE_SERVICE_HPP
#define REMOTE_SERVICE_HPP

#include "grpc++/server_context.h"
#include "manager/sandbox_manager.hpp"
#include "proto/service.grpc.pb.h"

namespace remote {

// Exposes a SandboxManager over gRPC. Tenant ids are trusted: the caller is
// authorized upstream.
class SandboxServiceImpl : public proto::SandboxService::Service {
 public:
  explicit SandboxServiceImpl(manager::SandboxManager* manager)
      : manager_(manager) {}

  grpc::Status CreateSandbox(grpc::ServerContext* context,
                             const proto::CreateSandboxRequest* request,
                             proto::CreateSandboxResponse* response) override;
  grpc::Status ExecuteCode(grpc::ServerContext* context,
                           const proto::ExecuteCodeRequest* request,
                           proto::ExecutionResult* response) override;
  grpc::Status GetState(grpc::ServerContext* context,
                        const proto::GetStateRequest* request,
                        proto::InstanceState* response) override;
  grpc::Status Cleanup(grpc::ServerContext* context,
                       const proto::CleanupRequest* request,
                       proto::CleanupResponse* response) override;
  grpc::Status GetHistory(grpc::ServerContext* context,
                          const proto::GetHistoryRequest* request,
                          proto::GetHistoryResponse* response) override;
  grpc::Status GetMetrics(grpc::ServerContext* context,
                          const proto::GetMetricsRequest* request,
                          proto::MetricsSnapshot* response) override;

 private:
  manager::SandboxManager* manager_;
};

}  // namespace remote

#endif
