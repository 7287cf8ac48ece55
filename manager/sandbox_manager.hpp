#ifndef MANAGER_SANDBOX_MANAGER_HPP
#define MANAGER_SANDBOX_MANAGER_HPP

#include <stdint.h>

#include <deque>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "capability/database.hpp"
#include "executor/engine.hpp"
#include "manager/instance.hpp"
#include "monitor/resource_monitor.hpp"
#include "policy/config.hpp"
#include "proto/sandbox.pb.h"
#include "proto/value.pb.h"

namespace manager {

class not_found : public std::runtime_error {
 public:
  explicit not_found(const std::string& id)
      : std::runtime_error("Sandbox " + id + " not found") {}
};

struct ManagerOptions {
  policy::ResourceCeilings ceilings;
  executor::EngineOptions engine;
  int64_t monitor_interval_millis = 1000;
  int64_t sweep_interval_millis = 5 * 60 * 1000;
  int64_t max_lifetime_millis = 60 * 60 * 1000;
  int64_t idle_ttl_millis = 30 * 60 * 1000;
  size_t history_size = 1000;
  size_t max_db_rows = 1000;

  static ManagerOptions FromFlags();
};

// Owns the live sandbox instances of the service. All methods are
// thread-safe; executions of different instances run in parallel, those of
// the same instance in call order. The manager must outlive every call made
// on it.
class SandboxManager {
 public:
  explicit SandboxManager(ManagerOptions options);
  ~SandboxManager();
  SandboxManager(const SandboxManager&) = delete;
  SandboxManager& operator=(const SandboxManager&) = delete;

  // Returns the id of a new instance. The configuration is clamped to the
  // ceilings; throws std::invalid_argument if it is not valid. The database,
  // if any, is shared by every execution of the instance.
  std::string Create(const std::string& tenant_id,
                     const policy::SandboxConfig& config,
                     std::shared_ptr<capability::Database> database = nullptr);

  // Runs source in the instance, waiting for the executions submitted
  // before. context is injected as globals on top of the session. Throws
  // not_found if the instance does not exist or is removed while waiting.
  proto::ExecutionResult Execute(
      const std::string& id, const std::string& source,
      const std::map<std::string, proto::Value>& context = {});

  // Throws not_found.
  proto::InstanceState Inspect(const std::string& id) const;

  // Removes the instance, cancelling its running execution. Returns false if
  // there was no such instance.
  bool Cleanup(const std::string& id);
  size_t CleanupAll();

  // Removes the instances older than the maximum lifetime, and the idle ones
  // not used for longer than the idle TTL. Returns how many were removed.
  size_t Sweep();

  // The last limit results, oldest first; only those of instance_id unless
  // it is empty.
  std::vector<proto::ExecutionResult> History(const std::string& instance_id,
                                              size_t limit) const;
  proto::MetricsSnapshot Metrics() const;

  // Starts and stops the resource monitor and the periodic sweep.
  void Start();
  void Stop();

  size_t size() const;

 private:
  struct Counters {
    int64_t created = 0;
    int64_t executions = 0;
    int64_t successful = 0;
    int64_t failed = 0;
    int64_t timeouts = 0;
    int64_t cancelled = 0;
    int64_t validation_failures = 0;
    int64_t monitor_terminations = 0;
    double total_execution_time = 0;
    int64_t peak_memory_bytes = 0;
    double peak_cpu_percent = 0;
  };

  std::shared_ptr<Instance> Find(const std::string& id) const
      EXCLUSIVE_LOCKS_REQUIRED(mu_);
  bool RemoveLocked(const std::string& id, const std::string& reason)
      EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void RecordLocked(const proto::ExecutionResult& result)
      EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void RecordSample(Instance* instance, const proto::ResourceSample& sample);

  const ManagerOptions options_;
  const executor::ExecutionEngine engine_;
  monitor::ResourceMonitor monitor_;

  mutable absl::Mutex mu_;
  std::map<std::string, std::shared_ptr<Instance>> instances_ GUARDED_BY(mu_);
  std::deque<proto::ExecutionResult> history_ GUARDED_BY(mu_);
  Counters counters_ GUARDED_BY(mu_);
  bool stopping_ GUARDED_BY(mu_) = false;
  std::thread sweeper_;
};

}  // namespace manager

#endif
