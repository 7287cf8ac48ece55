#include "manager/sandbox_manager.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#ifndef CODEBOX_WORKER_PATH
#define CODEBOX_WORKER_PATH "codebox-worker"
#endif

namespace {

using ::testing::_;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Return;

class MockDatabase : public capability::Database {
 public:
  MOCK_METHOD2(Query, std::vector<proto::Row>(const std::string&,
                                               const proto::ValueDict&));
  MOCK_METHOD0(Tables, std::vector<std::string>());
  MOCK_METHOD1(Schema, std::vector<proto::Row>(const std::string&));
};

manager::ManagerOptions TestOptions() {
  manager::ManagerOptions options;
  options.engine.worker_path = CODEBOX_WORKER_PATH;
  options.engine.kill_grace_millis = 500;
  options.monitor_interval_millis = 100;
  return options;
}

class SandboxManagerTest : public ::testing::Test {
 protected:
  SandboxManagerTest() {
    config_ = policy::SandboxConfig::Default();
    config_.max_execution_time = 5;
    config_.max_memory_mb = 64;
  }

  std::unique_ptr<manager::SandboxManager> Manager(
      manager::ManagerOptions options = TestOptions()) {
    return std::unique_ptr<manager::SandboxManager>(
        new manager::SandboxManager(std::move(options)));
  }

  proto::Value Int(int64_t value) {
    proto::Value v;
    v.set_int_value(value);
    return v;
  }

  policy::SandboxConfig config_;
};

TEST_F(SandboxManagerTest, SumOfRange) {
  auto sandboxes = Manager();
  std::string id = sandboxes->Create("tenant", config_);
  proto::ExecutionResult result =
      sandboxes->Execute(id, "__result__ = sum(range(10))\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  EXPECT_EQ(result.result().int_value(), 45);
  EXPECT_EQ(result.instance_id(), id);
  EXPECT_EQ(result.tenant_id(), "tenant");
  EXPECT_FALSE(result.execution_id().empty());
  EXPECT_EQ(sandboxes->Inspect(id).status(), proto::COMPLETED);
}

TEST_F(SandboxManagerTest, BlockedModule) {
  auto sandboxes = Manager();
  std::string id = sandboxes->Create("tenant", config_);
  proto::ExecutionResult result = sandboxes->Execute(id, "import os\n");
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_EQ(result.error_kind(), proto::VALIDATION_ERROR);
  EXPECT_THAT(result.error(), HasSubstr("os"));
  EXPECT_EQ(result.execution_time(), 0);
  EXPECT_EQ(result.memory_usage_kb(), 0);
  proto::MetricsSnapshot metrics = sandboxes->Metrics();
  EXPECT_EQ(metrics.validation_failures(), 1);
  EXPECT_EQ(metrics.failed_executions(), 1);
}

TEST_F(SandboxManagerTest, VariableHistoryAcrossExecutions) {
  auto sandboxes = Manager();
  std::string id = sandboxes->Create("tenant", config_);
  ASSERT_EQ(sandboxes->Execute(id, "inspect_var('x', 1)\n").status(),
            proto::COMPLETED);
  ASSERT_EQ(sandboxes->Execute(id, "inspect_var('x', 2)\n").status(),
            proto::COMPLETED);
  proto::InstanceState state = sandboxes->Inspect(id);
  EXPECT_THAT(state.debug_summary().variable_name(), Contains("x"));
  const proto::VariableHistory& history = state.variables().at("x");
  ASSERT_EQ(history.snapshot_size(), 2);
  EXPECT_EQ(history.snapshot(0).repr(), "1");
  EXPECT_EQ(history.snapshot(1).repr(), "2");
  EXPECT_EQ(state.execution_count(), 2);
}

TEST_F(SandboxManagerTest, SweepRemovesExpiredInstances) {
  manager::ManagerOptions options = TestOptions();
  options.max_lifetime_millis = 50;
  auto sandboxes = Manager(options);
  std::string id = sandboxes->Create("tenant", config_);
  EXPECT_EQ(sandboxes->Sweep(), 0);
  EXPECT_EQ(sandboxes->Metrics().active_sandboxes(), 1);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(sandboxes->Sweep(), 1);
  EXPECT_EQ(sandboxes->Metrics().active_sandboxes(), 0);
  EXPECT_EQ(sandboxes->Metrics().total_sandboxes_created(), 1);
  EXPECT_THROW(sandboxes->Inspect(id), manager::not_found);
  EXPECT_THROW(sandboxes->Execute(id, "x = 1\n"), manager::not_found);
  EXPECT_EQ(sandboxes->Sweep(), 0);
}

TEST_F(SandboxManagerTest, SweepRemovesIdleInstances) {
  manager::ManagerOptions options = TestOptions();
  options.idle_ttl_millis = 300;
  auto sandboxes = Manager(options);
  std::string idle = sandboxes->Create("tenant", config_);
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  std::string busy = sandboxes->Create("tenant", config_);
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_EQ(sandboxes->Sweep(), 1);
  EXPECT_THROW(sandboxes->Inspect(idle), manager::not_found);
  EXPECT_EQ(sandboxes->Inspect(busy).instance_id(), busy);
}

TEST_F(SandboxManagerTest, PeriodicSweep) {
  manager::ManagerOptions options = TestOptions();
  options.max_lifetime_millis = 10;
  options.sweep_interval_millis = 20;
  auto sandboxes = Manager(options);
  sandboxes->Create("tenant", config_);
  sandboxes->Start();
  for (int i = 0; i < 200 && sandboxes->size() > 0; i++)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  sandboxes->Stop();
  EXPECT_EQ(sandboxes->size(), 0);
}

TEST_F(SandboxManagerTest, DoubleCleanup) {
  auto sandboxes = Manager();
  std::string id = sandboxes->Create("tenant", config_);
  EXPECT_TRUE(sandboxes->Cleanup(id));
  EXPECT_FALSE(sandboxes->Cleanup(id));
  EXPECT_FALSE(sandboxes->Cleanup("unknown"));
  EXPECT_EQ(sandboxes->Metrics().active_sandboxes(), 0);
}

TEST_F(SandboxManagerTest, CleanupAll) {
  auto sandboxes = Manager();
  sandboxes->Create("a", config_);
  sandboxes->Create("b", config_);
  EXPECT_EQ(sandboxes->CleanupAll(), 2);
  EXPECT_EQ(sandboxes->CleanupAll(), 0);
  EXPECT_EQ(sandboxes->size(), 0);
}

TEST_F(SandboxManagerTest, UnknownInstance) {
  auto sandboxes = Manager();
  EXPECT_THROW(sandboxes->Execute("nope", "x = 1\n"), manager::not_found);
  EXPECT_THROW(sandboxes->Inspect("nope"), manager::not_found);
}

TEST_F(SandboxManagerTest, InvalidConfig) {
  auto sandboxes = Manager();
  config_.max_memory_mb = 0;
  EXPECT_THROW(sandboxes->Create("tenant", config_), std::invalid_argument);
  EXPECT_EQ(sandboxes->Metrics().total_sandboxes_created(), 0);
}

TEST_F(SandboxManagerTest, ConfigIsClamped) {
  manager::ManagerOptions options = TestOptions();
  options.ceilings.max_memory_mb = 32;
  options.ceilings.max_execution_time = 2;
  auto sandboxes = Manager(options);
  std::string id = sandboxes->Create("tenant", config_);
  proto::InstanceState state = sandboxes->Inspect(id);
  EXPECT_EQ(state.config().max_memory_mb(), 32);
  EXPECT_EQ(state.config().max_execution_time(), 2);
  EXPECT_EQ(sandboxes->Metrics().ceilings().max_memory_mb(), 32);
}

TEST_F(SandboxManagerTest, SessionAndContext) {
  auto sandboxes = Manager();
  std::string id = sandboxes->Create("tenant", config_);
  ASSERT_EQ(sandboxes->Execute(id, "a = [1, 2]\ndef f():\n    pass\n").status(),
            proto::COMPLETED);
  proto::ExecutionResult result =
      sandboxes->Execute(id, "__result__ = len(a) + b\n", {{"b", Int(40)}});
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  EXPECT_EQ(result.result().int_value(), 42);

  proto::InstanceState state = sandboxes->Inspect(id);
  EXPECT_EQ(state.session_variables().at("a"), "[1, 2]");
  EXPECT_EQ(state.session_variables().at("b"), "40");
  EXPECT_EQ(state.session_variables().count("f"), 0);
}

TEST_F(SandboxManagerTest, ExecutionsOfAnInstanceAreOrdered) {
  auto sandboxes = Manager();
  std::string id = sandboxes->Create("tenant", config_);
  proto::ExecutionResult first;
  std::thread slow([&]() {
    first = sandboxes->Execute(
        id, "for i in range(200000):\n    pass\nn = 1\n");
  });
  for (int i = 0; i < 500; i++) {
    if (sandboxes->Inspect(id).status() != proto::CREATED) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  proto::ExecutionResult second = sandboxes->Execute(id, "__result__ = n\n");
  slow.join();
  ASSERT_EQ(first.status(), proto::COMPLETED) << first.error();
  ASSERT_EQ(second.status(), proto::COMPLETED) << second.error();
  EXPECT_EQ(second.result().int_value(), 1);
  EXPECT_LE(first.completed_at_millis(), second.created_at_millis());
}

TEST_F(SandboxManagerTest, CleanupCancelsRunningExecution) {
  auto sandboxes = Manager();
  config_.max_execution_time = 30;
  std::string id = sandboxes->Create("tenant", config_);
  proto::ExecutionResult result;
  std::thread runner(
      [&]() { result = sandboxes->Execute(id, "while True:\n    pass\n"); });
  for (int i = 0; i < 1000; i++) {
    if (sandboxes->Inspect(id).status() == proto::RUNNING) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_TRUE(sandboxes->Cleanup(id));
  runner.join();
  EXPECT_EQ(result.status(), proto::CANCELLED);
  EXPECT_EQ(result.error_kind(), proto::CANCELLED_BY_CLIENT);
  EXPECT_LT(result.execution_time(), 5);
  EXPECT_EQ(sandboxes->Metrics().cancelled_executions(), 1);
}

TEST_F(SandboxManagerTest, MonitorSamplesRunningExecutions) {
  auto sandboxes = Manager();
  sandboxes->Start();
  config_.max_execution_time = 1;
  std::string id = sandboxes->Create("tenant", config_);
  proto::ExecutionResult result =
      sandboxes->Execute(id, "while True:\n    pass\n");
  sandboxes->Stop();
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_EQ(result.error_kind(), proto::TIMEOUT_EXCEEDED);
  EXPECT_FALSE(result.monitor_terminated());
  proto::InstanceState state = sandboxes->Inspect(id);
  EXPECT_GT(state.resource_usage().memory_bytes(), 0);
  EXPECT_GE(state.resource_usage().threads(), 1);
  EXPECT_GT(sandboxes->Metrics().peak_cpu_percent(), 0);
  EXPECT_EQ(sandboxes->Metrics().timeout_executions(), 1);
}

TEST_F(SandboxManagerTest, HistoryAndMetrics) {
  manager::ManagerOptions options = TestOptions();
  options.history_size = 3;
  auto sandboxes = Manager(options);
  std::string a = sandboxes->Create("tenant", config_);
  std::string b = sandboxes->Create("tenant", config_);
  sandboxes->Execute(a, "x = 1\n");
  sandboxes->Execute(b, "x = 1 / 0\n");
  sandboxes->Execute(a, "x = 2\n");
  sandboxes->Execute(a, "import os\n");

  std::vector<proto::ExecutionResult> all = sandboxes->History("", 10);
  ASSERT_EQ(all.size(), 3);
  EXPECT_EQ(all[0].instance_id(), b);
  EXPECT_EQ(all[2].error_kind(), proto::VALIDATION_ERROR);

  std::vector<proto::ExecutionResult> last = sandboxes->History(a, 1);
  ASSERT_EQ(last.size(), 1);
  EXPECT_EQ(last[0].error_kind(), proto::VALIDATION_ERROR);
  EXPECT_EQ(sandboxes->History(a, 10).size(), 2);

  proto::MetricsSnapshot metrics = sandboxes->Metrics();
  EXPECT_EQ(metrics.total_sandboxes_created(), 2);
  EXPECT_EQ(metrics.active_sandboxes(), 2);
  EXPECT_EQ(metrics.total_executions(), 4);
  EXPECT_EQ(metrics.successful_executions(), 2);
  EXPECT_EQ(metrics.failed_executions(), 2);
  EXPECT_DOUBLE_EQ(metrics.success_rate(), 0.5);
  EXPECT_GT(metrics.average_execution_time(), 0);
  EXPECT_GT(metrics.peak_memory_bytes(), 0);
}

TEST_F(SandboxManagerTest, DatabaseQueriesAreGuarded) {
  auto database = std::make_shared<MockDatabase>();
  proto::Row row;
  row.add_column("n");
  row.add_value()->set_int_value(7);
  EXPECT_CALL(*database, Query("SELECT n FROM t", _))
      .WillOnce(Return(std::vector<proto::Row>{row, row, row}));
  EXPECT_CALL(*database, Query("DROP TABLE t", _)).Times(0);

  manager::ManagerOptions options = TestOptions();
  options.max_db_rows = 2;
  auto sandboxes = Manager(options);
  std::string id = sandboxes->Create("tenant", config_, database);
  proto::ExecutionResult result =
      sandboxes->Execute(id, "__result__ = len(db_query('SELECT n FROM t'))\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  EXPECT_EQ(result.result().int_value(), 2);

  result = sandboxes->Execute(id, "db_query('DROP TABLE t')\n");
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_EQ(result.error_kind(), proto::RUNTIME_FAULT);
  EXPECT_THAT(result.error(), HasSubstr("DROP statements are not allowed"));

  proto::InstanceState state = sandboxes->Inspect(id);
  ASSERT_EQ(state.query_log_size(), 2);
  EXPECT_EQ(state.query_log(0).query(), "SELECT n FROM t");
  EXPECT_TRUE(state.query_log(0).accepted());
  EXPECT_EQ(state.query_log(0).tenant_id(), "tenant");
  EXPECT_GT(state.query_log(0).timestamp_millis(), 0);
  EXPECT_EQ(state.query_log(1).query(), "DROP TABLE t");
  EXPECT_FALSE(state.query_log(1).accepted());
  EXPECT_THAT(state.query_log(1).error(), HasSubstr("DROP"));
}

}  // namespace
