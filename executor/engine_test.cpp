#include "executor/engine.hpp"

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
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::StartsWith;

class MockDatabase : public capability::Database {
 public:
  MOCK_METHOD2(Query, std::vector<proto::Row>(const std::string&,
                                               const proto::ValueDict&));
  MOCK_METHOD0(Tables, std::vector<std::string>());
  MOCK_METHOD1(Schema, std::vector<proto::Row>(const std::string&));
};

TEST(StatusTrackerTest, Transitions) {
  executor::StatusTracker status;
  EXPECT_EQ(status.status(), proto::CREATED);
  EXPECT_THROW(status.Transition(proto::COMPLETED), std::logic_error);
  status.Transition(proto::RUNNING);
  EXPECT_THROW(status.Transition(proto::CREATED), std::logic_error);
  status.Transition(proto::TIMEOUT);
  status.Transition(proto::RUNNING);
  status.Transition(proto::CANCELLED);
  EXPECT_THROW(status.Transition(proto::RUNNING), std::logic_error);
  EXPECT_EQ(status.status(), proto::CANCELLED);

  executor::StatusTracker idle;
  idle.Transition(proto::CANCELLED);
  EXPECT_TRUE(executor::StatusTracker::IsTerminal(idle.status()));
  EXPECT_FALSE(executor::StatusTracker::IsTerminal(proto::RUNNING));
}

class EngineTest : public ::testing::Test {
 protected:
  EngineTest() : engine_(executor::EngineOptions{CODEBOX_WORKER_PATH, 500}) {
    config_ = policy::SandboxConfig::Default();
    config_.max_execution_time = 5;
    config_.max_memory_mb = 128;
  }

  proto::ExecutionResult Run(const std::string& source) {
    executor::ExecutionRequest request;
    request.execution_id = "e1";
    request.instance_id = "i1";
    request.tenant_id = "t1";
    request.config = std::make_shared<const policy::SandboxConfig>(config_);
    request.source = source;
    request.globals = globals_;
    request.database = database_;
    request.debugger = &debugger_;
    request.control = control_;
    return engine_.Execute(request, &session_);
  }

  executor::ExecutionEngine engine_;
  policy::SandboxConfig config_;
  debugger::Debugger debugger_;
  std::map<std::string, proto::Value> globals_;
  std::map<std::string, proto::Value> session_;
  capability::Database* database_ = nullptr;
  std::shared_ptr<sandbox::ExecutionControl> control_;
};

TEST_F(EngineTest, CompletesWithOutputAndResult) {
  proto::ExecutionResult result =
      Run("print('Hello, World!')\n__result__ = 42\n");
  EXPECT_EQ(result.status(), proto::COMPLETED) << result.error();
  EXPECT_EQ(result.error_kind(), proto::NO_ERROR);
  EXPECT_EQ(result.stdout(), "Hello, World!\n");
  EXPECT_EQ(result.result().int_value(), 42);
  EXPECT_EQ(result.execution_id(), "e1");
  EXPECT_EQ(result.instance_id(), "i1");
  EXPECT_GT(result.execution_time(), 0);
  EXPECT_GE(result.completed_at_millis(), result.created_at_millis());
}

TEST_F(EngineTest, ResultRoundTrips) {
  proto::ExecutionResult result =
      Run("__result__ = {'a': [1, 2.5, None], 'b': ('x', True)}\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  const proto::ValueDict& dict = result.result().dict_value();
  ASSERT_EQ(dict.entry_size(), 2);
  EXPECT_EQ(dict.entry(0).key().str_value(), "a");
  EXPECT_EQ(dict.entry(0).value().list_value().item(1).float_value(), 2.5);
  EXPECT_TRUE(dict.entry(0).value().list_value().item(2).null_value());
  EXPECT_EQ(dict.entry(1).value().tuple_value().item(0).str_value(), "x");
}

TEST_F(EngineTest, ResultIsAbsentUnlessAssigned) {
  proto::ExecutionResult result = Run("x = 1\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  EXPECT_FALSE(result.has_result());
  result = Run("__result__ = None\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  ASSERT_TRUE(result.has_result());
  EXPECT_TRUE(result.result().null_value());
}

TEST_F(EngineTest, NonDataResultBecomesRepr) {
  proto::ExecutionResult result = Run("__result__ = len\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  EXPECT_EQ(result.result().str_value(), "<built-in function len>");
}

TEST_F(EngineTest, DeeplyNestedResultBecomesRepr) {
  proto::ExecutionResult result = Run(
      "x = [1]\n"
      "for i in range(59):\n"
      "    x = [x]\n"
      "__result__ = x\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  EXPECT_EQ(result.result().str_value(),
            std::string(60, '[') + "1" + std::string(60, ']'));
  EXPECT_EQ(session_.count("x"), 0);
  EXPECT_EQ(session_.count("i"), 1);
}

TEST_F(EngineTest, LargeValuesAreNotKept) {
  proto::ExecutionResult result = Run(
      "big = 'x' * (5 * 1024 * 1024)\n"
      "small = 'y'\n"
      "__result__ = big\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  EXPECT_EQ(session_.count("big"), 0);
  EXPECT_EQ(session_["small"].str_value(), "y");
  EXPECT_LE(result.result().str_value().size(), 4u << 20);
  EXPECT_EQ(result.result().str_value().compare(0, 4, "'xxx"), 0);
}

TEST_F(EngineTest, BlockedModuleFailsValidation) {
  proto::ExecutionResult result = Run("import os\nos.system('ls')\n");
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_EQ(result.error_kind(), proto::VALIDATION_ERROR);
  EXPECT_THAT(result.error(), StartsWith("Code validation failed: "));
  EXPECT_EQ(result.execution_time(), 0);
}

TEST_F(EngineTest, BlockedCallableFailsValidation) {
  proto::ExecutionResult result = Run("eval('1 + 1')\n");
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_EQ(result.error_kind(), proto::VALIDATION_ERROR);
  EXPECT_EQ(result.execution_time(), 0);
}

TEST_F(EngineTest, InfiniteLoopTimesOut) {
  config_.max_execution_time = 1;
  proto::ExecutionResult result = Run("while True:\n    pass\n");
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_EQ(result.error_kind(), proto::TIMEOUT_EXCEEDED);
  EXPECT_EQ(result.error(), "Execution timeout after 1 seconds");
  EXPECT_GE(result.execution_time(), 1);
  EXPECT_LT(result.execution_time(), 2.5);
}

TEST_F(EngineTest, OverAllocationExceedsMemory) {
  config_.max_memory_mb = 64;
  proto::ExecutionResult result =
      Run("print('before')\nx = 'a' * (1024 * 1024 * 1024)\n");
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_EQ(result.error_kind(), proto::MEMORY_EXCEEDED);
  EXPECT_EQ(result.error(), "Memory limit exceeded (64 MB)");
  EXPECT_EQ(result.stdout(), "before\n");
}

TEST_F(EngineTest, RuntimeFault) {
  proto::ExecutionResult result =
      Run("def f():\n    return 1 / 0\nprint('partial')\nf()\n");
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_EQ(result.error_kind(), proto::RUNTIME_FAULT);
  EXPECT_EQ(result.error(),
            "Execution error: ZeroDivisionError: division by zero");
  EXPECT_EQ(result.stdout(), "partial\n");
  EXPECT_THAT(result.stderr(), StartsWith("Traceback (most recent call last)"));
  EXPECT_THAT(result.stderr(), HasSubstr("line 2, in f"));

  bool found = false;
  for (const proto::DebugEvent& event : result.debug_summary().recent_event()) {
    if (event.level() != proto::LEVEL_ERROR) continue;
    found = true;
    EXPECT_THAT(event.message(), HasSubstr("ZeroDivisionError"));
    EXPECT_THAT(event.data(), HasSubstr("'exception_type': 'ZeroDivisionError'"));
  }
  EXPECT_TRUE(found);
}

TEST_F(EngineTest, DebugEventsReachTheSupervisor) {
  proto::ExecutionResult result =
      Run("x = [1, 2]\ninspect_var('x', x)\ndebug('step', 'WARNING', x)\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  proto::DebugSummary summary = debugger_.Summary();
  // Start, the call above and completion.
  EXPECT_EQ(summary.total_events(), 3);
  ASSERT_EQ(debugger_.History("x").size(), 1);
  EXPECT_EQ(debugger_.History("x")[0].repr(), "[1, 2]");
  EXPECT_EQ(result.debug_summary().total_events(), 3);
}

TEST_F(EngineTest, DebuggingDisabled) {
  config_.enable_debugging = false;
  proto::ExecutionResult result = Run("debug('x')\n");
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_THAT(result.error(), HasSubstr("name 'debug' is not defined"));
  EXPECT_EQ(debugger_.Summary().total_events(), 0);
  EXPECT_FALSE(result.has_debug_summary());
}

TEST_F(EngineTest, OutputIsTruncated) {
  config_.max_output_bytes = 10;
  proto::ExecutionResult result = Run("print('0123456789abcdef')\n");
  EXPECT_EQ(result.status(), proto::COMPLETED);
  EXPECT_EQ(result.stdout(), "0123456789");
  EXPECT_TRUE(result.stdout_truncated());
}

TEST_F(EngineTest, GlobalsAndSession) {
  globals_["n"].set_int_value(41);
  proto::ExecutionResult result =
      Run("m = n + 1\ndef f():\n    pass\nimport math\n__result__ = m\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  EXPECT_EQ(result.result().int_value(), 42);
  EXPECT_EQ(session_.size(), 2);
  EXPECT_EQ(session_["n"].int_value(), 41);
  EXPECT_EQ(session_["m"].int_value(), 42);
}

TEST_F(EngineTest, SessionUntouchedOnFailure) {
  session_["keep"].set_bool_value(true);
  proto::ExecutionResult result = Run("raise ValueError('no')\n");
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_EQ(session_.size(), 1);
}

TEST_F(EngineTest, DatabaseCallsAreServed) {
  MockDatabase database;
  database_ = &database;
  proto::Row row;
  row.add_column("name");
  row.add_value()->set_str_value("ada");
  EXPECT_CALL(database, Query("SELECT name FROM users", _))
      .WillOnce(Return(std::vector<proto::Row>{row}));
  EXPECT_CALL(database, Tables())
      .WillOnce(Return(std::vector<std::string>{"users"}));
  proto::ExecutionResult result =
      Run("rows = db_query('SELECT name FROM users')\n"
          "__result__ = [rows[0]['name'], db_tables()]\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  const proto::ValueList& list = result.result().list_value();
  EXPECT_EQ(list.item(0).str_value(), "ada");
  EXPECT_EQ(list.item(1).list_value().item(0).str_value(), "users");
}

TEST_F(EngineTest, DatabaseErrorsAreCatchable) {
  MockDatabase database;
  database_ = &database;
  EXPECT_CALL(database, Schema("nope"))
      .WillOnce(::testing::Throw(capability::database_error("no such table")));
  proto::ExecutionResult result = Run(
      "try:\n    db_schema('nope')\nexcept RuntimeError as e:\n"
      "    __result__ = str(e)\n");
  ASSERT_EQ(result.status(), proto::COMPLETED) << result.error();
  EXPECT_EQ(result.result().str_value(), "database error: no such table");
}

TEST_F(EngineTest, Cancellation) {
  control_ = std::make_shared<sandbox::ExecutionControl>();
  std::shared_ptr<sandbox::ExecutionControl> control = control_;
  std::thread canceller([control]() {
    while (control->pid() == 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    control->RequestTermination(sandbox::Termination::kCancelled, "cleanup");
  });
  proto::ExecutionResult result = Run("while True:\n    pass\n");
  canceller.join();
  EXPECT_EQ(result.status(), proto::CANCELLED);
  EXPECT_EQ(result.error_kind(), proto::CANCELLED_BY_CLIENT);
  EXPECT_LT(result.execution_time(), 2);
}

TEST_F(EngineTest, MonitorTermination) {
  control_ = std::make_shared<sandbox::ExecutionControl>();
  std::shared_ptr<sandbox::ExecutionControl> control = control_;
  std::thread monitor([control]() {
    while (control->pid() == 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    control->RequestTermination(sandbox::Termination::kResourceLimit,
                                "Thread limit exceeded");
  });
  proto::ExecutionResult result = Run("while True:\n    pass\n");
  monitor.join();
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_EQ(result.error_kind(), proto::MONITOR_TERMINATED);
  EXPECT_TRUE(result.monitor_terminated());
  EXPECT_EQ(result.termination_reason(), "Thread limit exceeded");
}

TEST_F(EngineTest, MissingWorker) {
  executor::ExecutionEngine engine(
      executor::EngineOptions{"/nonexistent/codebox-worker", 500});
  executor::ExecutionRequest request;
  request.config = std::make_shared<const policy::SandboxConfig>(config_);
  request.source = "x = 1\n";
  proto::ExecutionResult result = engine.Execute(request);
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_EQ(result.error_kind(), proto::INTERNAL_ERROR);
  EXPECT_THAT(result.error(), HasSubstr("exec"));
}

}  // namespace
