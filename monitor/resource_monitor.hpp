#ifndef MONITOR_RESOURCE_MONITOR_HPP
#define MONITOR_RESOURCE_MONITOR_HPP

#include <stdint.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "policy/config.hpp"
#include "proto/sandbox.pb.h"
#include "sandbox/control.hpp"

namespace monitor {

// Thresholds of one monitored execution. Zero disables a check.
struct Limits {
  int64_t max_memory_bytes = 0;
  int32_t max_open_files = 0;
  int32_t max_threads = 0;
  int32_t max_processes = 0;
  // Only logged.
  double max_cpu_percent = 0;
  int64_t max_runtime_millis = 0;

  // The runtime limit gets grace_millis on top of max_execution_time, since
  // the engine enforces the deadline itself.
  static Limits ForConfig(const policy::SandboxConfig& config,
                          int64_t grace_millis);
};

// Reads the resource usage of a process.
class ProcessProbe {
 public:
  virtual ~ProcessProbe() = default;
  // Returns false if the process does not exist anymore. The timestamp is
  // filled by the caller.
  virtual bool Sample(int pid, proto::ResourceSample* sample) = 0;
  // Drops any state kept about pid.
  virtual void Forget(int pid) {}
};

// Probe backed by /proc/<pid>/status, /proc/<pid>/stat and /proc/<pid>/fd.
// CPU usage is computed between two consecutive samples of the same pid.
// Processes are counted by session, since sandboxed processes lead their
// own.
class ProcProbe : public ProcessProbe {
 public:
  bool Sample(int pid, proto::ResourceSample* sample) override;
  void Forget(int pid) override { last_cpu_.erase(pid); }

 private:
  struct CpuReading {
    int64_t ticks;
    int64_t at_millis;
  };
  std::map<int, CpuReading> last_cpu_;
};

// Polls the running executions on a background thread and asks the ones
// that go over their limits to terminate.
class ResourceMonitor {
 public:
  using SampleCallback = std::function<void(const proto::ResourceSample&)>;

  ResourceMonitor(std::unique_ptr<ProcessProbe> probe, int64_t interval_millis)
      : probe_(std::move(probe)), interval_millis_(interval_millis) {}
  ~ResourceMonitor() { Stop(); }
  ResourceMonitor(const ResourceMonitor&) = delete;
  ResourceMonitor& operator=(const ResourceMonitor&) = delete;

  // on_sample, if set, is called from the monitor thread with every sample
  // of this execution.
  void Register(const std::string& id,
                std::shared_ptr<sandbox::ExecutionControl> control,
                Limits limits, SampleCallback on_sample = nullptr);
  void Unregister(const std::string& id);
  size_t size() const;

  // Samples every registered execution once. Executions whose process does
  // not exist (yet, or anymore) are skipped.
  void SampleOnce();

  void Start();
  void Stop();

 private:
  struct Entry {
    std::shared_ptr<sandbox::ExecutionControl> control;
    Limits limits;
    SampleCallback on_sample;
    int last_pid = 0;
  };

  // Returns the termination to request for this sample, or kNone.
  static sandbox::Termination Check(const std::string& id, const Entry& entry,
                                    const proto::ResourceSample& sample,
                                    std::string* reason);

  mutable absl::Mutex mu_;
  std::map<std::string, Entry> entries_ GUARDED_BY(mu_);
  bool stopping_ GUARDED_BY(mu_) = false;

  absl::Mutex sample_mu_ ACQUIRED_BEFORE(mu_);
  std::unique_ptr<ProcessProbe> probe_ GUARDED_BY(sample_mu_);

  int64_t interval_millis_;
  std::thread thread_;
};

}  // namespace monitor

#endif
