#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <fstream>
#include <memory>
#include <sstream>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#ifndef SANDBOX_HELPER_PATH
#define SANDBOX_HELPER_PATH "sandbox/test/sandbox_helper"
#endif

namespace {

using ::testing::StartsWith;

using namespace sandbox;

class UnixTest : public ::testing::Test {
 protected:
  UnixTest() : sandbox_(Sandbox::Create()) {}

  ExecutionOptions Options(const std::string& mode, const std::string& arg) {
    ExecutionOptions options("/", SANDBOX_HELPER_PATH);
    options.args.push_back(mode);
    options.args.push_back(arg);
    return options;
  }

  std::string Output() {
    std::ifstream in(stdout_file_);
    std::stringstream out;
    out << in.rdbuf();
    return out.str();
  }

  std::unique_ptr<Sandbox> sandbox_;
  ExecutionInfo info_;
  std::string error_msg_;
  std::string stdout_file_ = ::testing::TempDir() + "/sandbox_stdout";
};

TEST_F(UnixTest, TestNoDir) {
  ExecutionOptions options("/nonexistent/dir", SANDBOX_HELPER_PATH);
  EXPECT_FALSE(sandbox_->Execute(options, &info_, &error_msg_));
  EXPECT_THAT(error_msg_, StartsWith("chdir:"));
}

TEST_F(UnixTest, TestNoFile) {
  ExecutionOptions options("/", "/nonexistent/program");
  EXPECT_FALSE(sandbox_->Execute(options, &info_, &error_msg_));
  EXPECT_THAT(error_msg_, StartsWith("exec:"));
}

TEST_F(UnixTest, TestExitCode) {
  EXPECT_TRUE(sandbox_->Execute(Options("exit", "15"), &info_, &error_msg_));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.status_code, 15);
  EXPECT_EQ(info_.signal, 0);
  EXPECT_FALSE(info_.wall_limit_exceeded);
  EXPECT_EQ(info_.termination, Termination::kNone);
}

TEST_F(UnixTest, TestSignal) {
  EXPECT_TRUE(sandbox_->Execute(Options("signal", "6"), &info_, &error_msg_));
  EXPECT_EQ(info_.signal, 6);
  EXPECT_EQ(info_.status_code, 0);
}

TEST_F(UnixTest, TestWallLimitOk) {
  ExecutionOptions options = Options("sleep", "0.1");
  options.wall_limit_millis = 1000;
  EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg_));
  EXPECT_EQ(info_.signal, 0);
  EXPECT_FALSE(info_.wall_limit_exceeded);
  EXPECT_GE(info_.wall_time_millis, 90);
  EXPECT_LE(info_.cpu_time_millis, 50);
}

TEST_F(UnixTest, TestWallLimitNotOk) {
  ExecutionOptions options = Options("sleep", "5");
  options.wall_limit_millis = 100;
  EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg_));
  EXPECT_EQ(info_.signal, SIGKILL);
  EXPECT_TRUE(info_.wall_limit_exceeded);
  EXPECT_GE(info_.wall_time_millis, 100);
  EXPECT_LE(info_.wall_time_millis, 1000);
}

TEST_F(UnixTest, TestCpuLimitNotOk) {
  ExecutionOptions options = Options("spin", "10");
  options.cpu_limit_millis = 1000;
  EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg_));
  EXPECT_THAT(info_.signal, ::testing::AnyOf(SIGXCPU, SIGKILL));
  EXPECT_GE(info_.cpu_time_millis + info_.sys_time_millis, 900);
  EXPECT_LE(info_.cpu_time_millis + info_.sys_time_millis, 2100);
}

TEST_F(UnixTest, TestMemoryLimit) {
  ExecutionOptions options = Options("alloc", "256");
  options.memory_limit_kb = 64 * 1024;
  EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg_));
  EXPECT_EQ(info_.status_code, 3);

  ExecutionOptions small = Options("alloc", "8");
  small.memory_limit_kb = 64 * 1024;
  EXPECT_TRUE(sandbox_->Execute(small, &info_, &error_msg_));
  EXPECT_EQ(info_.status_code, 0);
  EXPECT_GE(info_.memory_usage_kb, 8 * 1024);
}

TEST_F(UnixTest, TestDescriptorsAreNotInherited) {
  int leaked = open("/dev/null", O_RDONLY);
  ASSERT_NE(leaked, -1);
  ExecutionOptions options = Options("fds", "");
  options.stdout_file = stdout_file_;
  EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg_));
  close(leaked);
  EXPECT_EQ(info_.status_code, 0);
  EXPECT_EQ(Output(), "3\n");
}

TEST_F(UnixTest, TestChannel) {
  int fds[2];
  ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
  ExecutionOptions options = Options("channel", "");
  options.channel_fd = fds[1];
  EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg_));
  close(fds[1]);
  EXPECT_EQ(info_.status_code, 0);
  char buf[8] = {};
  EXPECT_EQ(read(fds[0], buf, sizeof(buf)), 4);
  EXPECT_STREQ(buf, "ping");
  close(fds[0]);
}

TEST_F(UnixTest, TestNoNewPrivileges) {
  ExecutionOptions options = Options("nnp", "");
  options.stdout_file = stdout_file_;
  EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg_));
  EXPECT_EQ(info_.status_code, 0);
  EXPECT_EQ(Output(), "1\n");
}

TEST_F(UnixTest, TestTerminationRequest) {
  auto control = std::make_shared<ExecutionControl>();
  ExecutionOptions options = Options("sleep", "10");
  options.control = control;
  std::thread canceller([control]() {
    while (control->pid() == 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_TRUE(control->RequestTermination(Termination::kCancelled, "bye"));
    EXPECT_FALSE(
        control->RequestTermination(Termination::kTimeLimit, "too late"));
  });
  EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg_));
  canceller.join();
  EXPECT_EQ(info_.signal, SIGTERM);
  EXPECT_EQ(info_.termination, Termination::kCancelled);
  EXPECT_EQ(info_.termination_reason, "bye");
  EXPECT_LE(info_.wall_time_millis, 2000);
  EXPECT_EQ(control->pid(), 0);
}

TEST_F(UnixTest, TestTerminationEscalates) {
  auto control = std::make_shared<ExecutionControl>();
  ExecutionOptions options = Options("ignore_term", "10");
  options.control = control;
  options.kill_grace_millis = 300;
  std::thread requester([control]() {
    while (control->pid() == 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    // Leaves the child time to ignore SIGTERM.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    control->RequestTermination(Termination::kMemoryLimit, "too big");
  });
  EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg_));
  requester.join();
  EXPECT_EQ(info_.signal, SIGKILL);
  EXPECT_EQ(info_.termination, Termination::kMemoryLimit);
  EXPECT_GE(info_.wall_time_millis, 500);
  EXPECT_LE(info_.wall_time_millis, 3000);
}

}  // namespace
