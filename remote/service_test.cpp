#include "remote/service.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#ifndef CODEBOX_WORKER_PATH
#define CODEBOX_WORKER_PATH "codebox-worker"
#endif

namespace {

using ::testing::HasSubstr;

class SandboxServiceTest : public ::testing::Test {
 protected:
  static manager::ManagerOptions Options() {
    manager::ManagerOptions options;
    options.engine.worker_path = CODEBOX_WORKER_PATH;
    options.engine.kill_grace_millis = 500;
    return options;
  }

  SandboxServiceTest() : manager_(Options()), service_(&manager_) {}

  std::string Create() {
    proto::CreateSandboxRequest request;
    request.set_tenant_id("tenant");
    request.mutable_config()->set_max_execution_time(5);
    proto::CreateSandboxResponse response;
    grpc::Status status = service_.CreateSandbox(&context_, &request, &response);
    EXPECT_TRUE(status.ok()) << status.error_message();
    return response.instance_id();
  }

  grpc::ServerContext context_;
  manager::SandboxManager manager_;
  remote::SandboxServiceImpl service_;
};

TEST_F(SandboxServiceTest, CreateRequiresTenant) {
  proto::CreateSandboxRequest request;
  proto::CreateSandboxResponse response;
  EXPECT_EQ(service_.CreateSandbox(&context_, &request, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(SandboxServiceTest, InvalidConfig) {
  proto::CreateSandboxRequest request;
  request.set_tenant_id("tenant");
  request.mutable_config()->set_max_recursion_depth(5000);
  proto::CreateSandboxResponse response;
  grpc::Status status = service_.CreateSandbox(&context_, &request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_THAT(status.error_message(), HasSubstr("max_recursion_depth"));
}

TEST_F(SandboxServiceTest, UnknownInstance) {
  proto::ExecuteCodeRequest execute;
  execute.set_instance_id("nope");
  execute.set_source("x = 1\n");
  proto::ExecutionResult result;
  EXPECT_EQ(service_.ExecuteCode(&context_, &execute, &result).error_code(),
            grpc::StatusCode::NOT_FOUND);

  proto::GetStateRequest get_state;
  get_state.set_instance_id("nope");
  proto::InstanceState state;
  EXPECT_EQ(service_.GetState(&context_, &get_state, &state).error_code(),
            grpc::StatusCode::NOT_FOUND);

  proto::CleanupRequest cleanup;
  cleanup.set_instance_id("nope");
  proto::CleanupResponse removed;
  EXPECT_TRUE(service_.Cleanup(&context_, &cleanup, &removed).ok());
  EXPECT_FALSE(removed.removed());
}

TEST_F(SandboxServiceTest, ExecuteWithContext) {
  std::string id = Create();
  proto::ExecuteCodeRequest request;
  request.set_instance_id(id);
  request.set_source("print(greeting)\n__result__ = greeting.upper()\n");
  (*request.mutable_context())["greeting"].set_str_value("hi");
  proto::ExecutionResult result;
  ASSERT_TRUE(service_.ExecuteCode(&context_, &request, &result).ok());
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  EXPECT_EQ(result.stdout(), "hi\n");
  EXPECT_EQ(result.result().str_value(), "HI");

  proto::GetStateRequest get_state;
  get_state.set_instance_id(id);
  proto::InstanceState state;
  ASSERT_TRUE(service_.GetState(&context_, &get_state, &state).ok());
  EXPECT_EQ(state.tenant_id(), "tenant");
  EXPECT_EQ(state.config().max_execution_time(), 5);
  EXPECT_EQ(state.execution_count(), 1);

  proto::GetHistoryRequest history_request;
  proto::GetHistoryResponse history;
  ASSERT_TRUE(service_.GetHistory(&context_, &history_request, &history).ok());
  ASSERT_EQ(history.result_size(), 1);
  EXPECT_EQ(history.result(0).execution_id(), result.execution_id());

  proto::GetMetricsRequest metrics_request;
  proto::MetricsSnapshot metrics;
  ASSERT_TRUE(service_.GetMetrics(&context_, &metrics_request, &metrics).ok());
  EXPECT_EQ(metrics.successful_executions(), 1);

  proto::CleanupRequest cleanup;
  cleanup.set_instance_id(id);
  proto::CleanupResponse removed;
  ASSERT_TRUE(service_.Cleanup(&context_, &cleanup, &removed).ok());
  EXPECT_TRUE(removed.removed());
}

}  // namespace
