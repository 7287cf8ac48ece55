#include "monitor/resource_monitor.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <map>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using sandbox::ExecutionControl;
using sandbox::Termination;

// Shared with the test after the monitor takes ownership of the probe.
struct FakeProcesses {
  std::map<int, proto::ResourceSample> samples;
  std::map<int, int> calls;
  std::vector<int> forgotten;
};

class FakeProbe : public monitor::ProcessProbe {
 public:
  explicit FakeProbe(FakeProcesses* processes) : processes_(processes) {}
  bool Sample(int pid, proto::ResourceSample* sample) override {
    processes_->calls[pid]++;
    auto it = processes_->samples.find(pid);
    if (it == processes_->samples.end()) return false;
    *sample = it->second;
    return true;
  }
  void Forget(int pid) override { processes_->forgotten.push_back(pid); }

 private:
  FakeProcesses* processes_;
};

class ResourceMonitorTest : public ::testing::Test {
 protected:
  ResourceMonitorTest()
      : monitor_(std::unique_ptr<monitor::ProcessProbe>(new FakeProbe(&processes_)),
                 10) {
    limits_.max_memory_bytes = 100 << 20;
    limits_.max_open_files = 10;
    limits_.max_threads = 4;
    limits_.max_processes = 2;
    limits_.max_cpu_percent = 50;
  }

  std::shared_ptr<ExecutionControl> Running(int pid,
                                            const proto::ResourceSample& sample) {
    auto control = std::make_shared<ExecutionControl>();
    control->SetPid(pid);
    processes_.samples[pid] = sample;
    return control;
  }

  FakeProcesses processes_;
  monitor::ResourceMonitor monitor_;
  monitor::Limits limits_;
};

proto::ResourceSample Usage(int64_t memory_mb, int threads, int handles,
                            double cpu = 1) {
  proto::ResourceSample sample;
  sample.set_memory_bytes(memory_mb << 20);
  sample.set_threads(threads);
  sample.set_open_handles(handles);
  sample.set_cpu_percent(cpu);
  return sample;
}

TEST(LimitsTest, ForConfig) {
  policy::SandboxConfig config = policy::SandboxConfig::Default();
  config.max_execution_time = 2.5;
  config.max_memory_mb = 64;
  config.max_open_files = 7;
  config.max_threads = 3;
  config.max_processes = 2;
  monitor::Limits limits = monitor::Limits::ForConfig(config, 1000);
  EXPECT_EQ(limits.max_memory_bytes, 64 << 20);
  EXPECT_EQ(limits.max_open_files, 7);
  EXPECT_EQ(limits.max_threads, 3);
  EXPECT_EQ(limits.max_processes, 2);
  EXPECT_EQ(limits.max_runtime_millis, 3500);
}

TEST_F(ResourceMonitorTest, WithinLimits) {
  auto control = Running(100, Usage(10, 1, 3));
  std::vector<proto::ResourceSample> seen;
  monitor_.Register("a", control, limits_,
                    [&seen](const proto::ResourceSample& s) { seen.push_back(s); });
  monitor_.SampleOnce();
  EXPECT_EQ(control->termination(), Termination::kNone);
  ASSERT_EQ(seen.size(), 1);
  EXPECT_EQ(seen[0].memory_bytes(), 10 << 20);
  EXPECT_GT(seen[0].timestamp_millis(), 0);
}

TEST_F(ResourceMonitorTest, MemoryBreach) {
  auto control = Running(100, Usage(200, 1, 3));
  monitor_.Register("a", control, limits_);
  monitor_.SampleOnce();
  std::string reason;
  EXPECT_EQ(control->termination(&reason), Termination::kMemoryLimit);
  EXPECT_EQ(reason, "Memory limit exceeded");
}

TEST_F(ResourceMonitorTest, HandleAndThreadBreaches) {
  auto files = Running(100, Usage(10, 1, 11));
  auto threads = Running(101, Usage(10, 5, 3));
  monitor_.Register("files", files, limits_);
  monitor_.Register("threads", threads, limits_);
  monitor_.SampleOnce();
  std::string reason;
  EXPECT_EQ(files->termination(&reason), Termination::kResourceLimit);
  EXPECT_EQ(reason, "Open files limit exceeded");
  EXPECT_EQ(threads->termination(&reason), Termination::kResourceLimit);
  EXPECT_EQ(reason, "Thread limit exceeded");
}

TEST_F(ResourceMonitorTest, ProcessBreach) {
  proto::ResourceSample two = Usage(10, 1, 3);
  two.set_processes(2);
  proto::ResourceSample three = Usage(10, 1, 3);
  three.set_processes(3);
  auto within = Running(100, two);
  auto over = Running(101, three);
  monitor_.Register("within", within, limits_);
  monitor_.Register("over", over, limits_);
  monitor_.SampleOnce();
  std::string reason;
  EXPECT_EQ(within->termination(), Termination::kNone);
  EXPECT_EQ(over->termination(&reason), Termination::kResourceLimit);
  EXPECT_EQ(reason, "Process limit exceeded");
}

TEST_F(ResourceMonitorTest, CpuIsOnlyLogged) {
  auto control = Running(100, Usage(10, 1, 3, 400));
  monitor_.Register("a", control, limits_);
  monitor_.SampleOnce();
  EXPECT_EQ(control->termination(), Termination::kNone);
}

TEST_F(ResourceMonitorTest, RuntimeBackstop) {
  auto control = Running(100, Usage(10, 1, 3));
  limits_.max_runtime_millis = 1;
  monitor_.Register("a", control, limits_);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  monitor_.SampleOnce();
  EXPECT_EQ(control->termination(), Termination::kTimeLimit);
}

TEST_F(ResourceMonitorTest, FirstCauseWins) {
  auto control = Running(100, Usage(200, 1, 3));
  control->RequestTermination(Termination::kCancelled, "client");
  monitor_.Register("a", control, limits_);
  monitor_.SampleOnce();
  std::string reason;
  EXPECT_EQ(control->termination(&reason), Termination::kCancelled);
  EXPECT_EQ(reason, "client");
}

TEST_F(ResourceMonitorTest, NotStartedAndVanishedAreSkipped) {
  auto idle = std::make_shared<ExecutionControl>();
  auto gone = std::make_shared<ExecutionControl>();
  gone->SetPid(200);
  int samples = 0;
  auto count = [&samples](const proto::ResourceSample&) { samples++; };
  monitor_.Register("idle", idle, limits_, count);
  monitor_.Register("gone", gone, limits_, count);
  monitor_.SampleOnce();
  EXPECT_EQ(samples, 0);
  EXPECT_EQ(processes_.calls.count(0), 0);
  EXPECT_EQ(processes_.calls[200], 1);
  EXPECT_EQ(gone->termination(), Termination::kNone);
}

TEST_F(ResourceMonitorTest, Unregister) {
  auto control = Running(100, Usage(10, 1, 3));
  monitor_.Register("a", control, limits_);
  EXPECT_EQ(monitor_.size(), 1);
  monitor_.SampleOnce();
  monitor_.Unregister("a");
  monitor_.Unregister("a");
  EXPECT_EQ(monitor_.size(), 0);
  monitor_.SampleOnce();
  EXPECT_EQ(processes_.calls[100], 1);
  EXPECT_THAT(processes_.forgotten, ::testing::ElementsAre(100));
}

TEST_F(ResourceMonitorTest, BackgroundThread) {
  auto control = Running(100, Usage(10, 1, 3));
  std::atomic<int> samples(0);
  monitor_.Register("a", control, limits_,
                    [&samples](const proto::ResourceSample&) { samples++; });
  monitor_.Start();
  for (int i = 0; i < 500 && samples < 3; i++)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  monitor_.Stop();
  EXPECT_GE(samples, 3);
  int after_stop = samples;
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(samples, after_stop);
}

TEST(ProcProbeTest, OwnProcess) {
  monitor::ProcProbe probe;
  proto::ResourceSample sample;
  ASSERT_TRUE(probe.Sample(getpid(), &sample));
  EXPECT_GT(sample.memory_bytes(), 0);
  EXPECT_GE(sample.threads(), 1);
  EXPECT_GE(sample.open_handles(), 3);
  ASSERT_TRUE(probe.Sample(getpid(), &sample));
  EXPECT_GE(sample.cpu_percent(), 0);
}

TEST(ProcProbeTest, CountsProcessesOfTheSession) {
  int ready[2];
  ASSERT_EQ(pipe(ready), 0);
  pid_t leader = fork();
  ASSERT_GE(leader, 0);
  if (leader == 0) {
    setsid();
    if (fork() == 0) {
      close(ready[0]);
      if (write(ready[1], "x", 1) != 1) _exit(1);
      pause();
      _exit(0);
    }
    pause();
    _exit(0);
  }
  close(ready[1]);
  char c;
  ASSERT_EQ(read(ready[0], &c, 1), 1);
  close(ready[0]);
  monitor::ProcProbe probe;
  proto::ResourceSample sample;
  EXPECT_TRUE(probe.Sample(leader, &sample));
  EXPECT_EQ(sample.processes(), 2);
  kill(-leader, SIGKILL);
  waitpid(leader, nullptr, 0);
}

TEST(ProcProbeTest, MissingProcess) {
  monitor::ProcProbe probe;
  proto::ResourceSample sample;
  EXPECT_FALSE(probe.Sample(1 << 30, &sample));
}

}  // namespace
