#include "manager/sandbox_manager.hpp"

#include <algorithm>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "capability/query_guard.hpp"
#include "capability/value_codec.hpp"
#include "glog/logging.h"
#include "script/value.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace manager {
namespace {

struct Turn {
  const Instance* instance;
  uint64_t ticket;
};

bool IsTurn(Turn* turn) {
  return turn->instance->removed ||
         turn->instance->now_serving == turn->ticket;
}

}  // namespace

ManagerOptions ManagerOptions::FromFlags() {
  ManagerOptions options;
  options.ceilings = policy::ResourceCeilings::FromFlags();
  options.engine.worker_path = executor::FindWorker();
  options.engine.kill_grace_millis = FLAGS_kill_grace_millis;
  options.monitor_interval_millis = FLAGS_monitor_interval_millis;
  options.sweep_interval_millis = FLAGS_cleanup_interval_seconds * 1000LL;
  options.max_lifetime_millis = FLAGS_max_sandbox_lifetime_seconds * 1000LL;
  options.idle_ttl_millis = FLAGS_sandbox_idle_ttl_seconds * 1000LL;
  options.history_size = std::max(FLAGS_history_size, 0);
  options.max_db_rows = std::max(FLAGS_max_db_rows, 0);
  return options;
}

SandboxManager::SandboxManager(ManagerOptions options)
    : options_(std::move(options)),
      engine_(options_.engine),
      monitor_(absl::make_unique<monitor::ProcProbe>(),
               options_.monitor_interval_millis) {}

SandboxManager::~SandboxManager() { Stop(); }

std::shared_ptr<Instance> SandboxManager::Find(const std::string& id) const {
  auto it = instances_.find(id);
  if (it == instances_.end()) throw not_found(id);
  return it->second;
}

std::string SandboxManager::Create(
    const std::string& tenant_id, const policy::SandboxConfig& config,
    std::shared_ptr<capability::Database> database) {
  auto clamped = std::make_shared<policy::SandboxConfig>(
      config.ClampedTo(options_.ceilings));
  clamped->CheckValid();
  std::shared_ptr<capability::GuardedDatabase> guarded;
  if (database)
    guarded = std::make_shared<capability::GuardedDatabase>(
        std::move(database), options_.max_db_rows, tenant_id);

  std::string id = util::RandomId();
  auto instance = std::make_shared<Instance>(id, tenant_id, std::move(clamped),
                                             std::move(guarded),
                                             util::NowMillis());
  absl::MutexLock lock(&mu_);
  instances_.emplace(id, std::move(instance));
  counters_.created++;
  LOG(INFO) << "Created sandbox " << id << " for tenant " << tenant_id;
  return id;
}

proto::ExecutionResult SandboxManager::Execute(
    const std::string& id, const std::string& source,
    const std::map<std::string, proto::Value>& context) {
  std::shared_ptr<Instance> instance;
  executor::ExecutionRequest request;
  {
    absl::MutexLock lock(&mu_);
    instance = Find(id);
    Turn turn{instance.get(), instance->next_ticket++};
    mu_.Await(absl::Condition(&IsTurn, &turn));
    if (instance->removed) throw not_found(id);
    if (!executor::StatusTracker::CanTransition(instance->status.status(),
                                                proto::RUNNING)) {
      instance->now_serving++;
      throw std::logic_error(
          absl::StrCat("Sandbox ", id, " is ",
                       proto::Status_Name(instance->status.status())));
    }
    instance->status.Transition(proto::RUNNING);
    instance->control = std::make_shared<sandbox::ExecutionControl>();
    instance->last_activity_millis = util::NowMillis();
    request.control = instance->control;
    request.globals = instance->session;
  }
  for (const auto& global : context) request.globals[global.first] = global.second;
  request.execution_id = util::RandomId();
  request.instance_id = id;
  request.tenant_id = instance->tenant_id;
  request.config = instance->config;
  request.source = source;
  request.database = instance->database.get();
  request.debugger = &instance->debugger;

  monitor_.Register(
      request.execution_id, request.control,
      monitor::Limits::ForConfig(*instance->config,
                                 options_.engine.kill_grace_millis),
      [this, instance](const proto::ResourceSample& sample) {
        RecordSample(instance.get(), sample);
      });

  std::map<std::string, proto::Value> session;
  proto::ExecutionResult result;
  try {
    result = engine_.Execute(request, &session);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Execution " << request.execution_id << " of sandbox " << id
               << " failed: " << e.what();
    result.Clear();
    result.set_execution_id(request.execution_id);
    result.set_instance_id(id);
    result.set_tenant_id(instance->tenant_id);
    result.set_status(proto::FAILED);
    result.set_error_kind(proto::INTERNAL_ERROR);
    result.set_error(absl::StrCat("Internal error: ", e.what()));
    result.set_completed_at_millis(util::NowMillis());
  }
  monitor_.Unregister(request.execution_id);

  absl::MutexLock lock(&mu_);
  instance->control.reset();
  instance->now_serving++;
  instance->execution_count++;
  instance->last_activity_millis = util::NowMillis();
  if (!instance->removed) {
    instance->status.Transition(result.status());
    if (result.status() == proto::COMPLETED)
      instance->session = std::move(session);
  }
  RecordLocked(result);
  return result;
}

void SandboxManager::RecordLocked(const proto::ExecutionResult& result) {
  history_.push_back(result);
  while (history_.size() > options_.history_size) history_.pop_front();

  counters_.executions++;
  counters_.total_execution_time += result.execution_time();
  switch (result.status()) {
    case proto::COMPLETED:
      counters_.successful++;
      break;
    case proto::FAILED:
      counters_.failed++;
      break;
    case proto::TIMEOUT:
      counters_.timeouts++;
      break;
    case proto::CANCELLED:
      counters_.cancelled++;
      break;
    default:
      LOG(DFATAL) << "Execution " << result.execution_id() << " ended as "
                  << proto::Status_Name(result.status());
  }
  if (result.error_kind() == proto::VALIDATION_ERROR)
    counters_.validation_failures++;
  if (result.monitor_terminated()) counters_.monitor_terminations++;
  counters_.peak_memory_bytes =
      std::max(counters_.peak_memory_bytes, result.memory_usage_kb() * 1024);
}

void SandboxManager::RecordSample(Instance* instance,
                                  const proto::ResourceSample& sample) {
  absl::MutexLock lock(&mu_);
  instance->last_sample = sample;
  counters_.peak_memory_bytes =
      std::max(counters_.peak_memory_bytes, sample.memory_bytes());
  counters_.peak_cpu_percent =
      std::max(counters_.peak_cpu_percent, sample.cpu_percent());
}

proto::InstanceState SandboxManager::Inspect(const std::string& id) const {
  absl::MutexLock lock(&mu_);
  std::shared_ptr<Instance> instance = Find(id);
  int64_t now = util::NowMillis();
  proto::InstanceState state;
  state.set_instance_id(instance->id);
  state.set_tenant_id(instance->tenant_id);
  state.set_status(instance->status.status());
  for (auto& variable : instance->debugger.Variables())
    (*state.mutable_variables())[variable.first] = std::move(variable.second);
  for (const auto& variable : instance->session)
    (*state.mutable_session_variables())[variable.first] =
        script::Repr(capability::FromProto(variable.second));
  *state.mutable_resource_usage() = instance->last_sample;
  *state.mutable_config() = instance->config->ToProto();
  state.set_age_seconds((now - instance->created_at_millis) / 1000.0);
  state.set_idle_seconds((now - instance->last_activity_millis) / 1000.0);
  state.set_execution_count(instance->execution_count);
  if (instance->config->enable_debugging)
    *state.mutable_debug_summary() = instance->debugger.Summary();
  if (instance->database) {
    for (auto& record : instance->database->QueryLog())
      *state.add_query_log() = std::move(record);
  }
  return state;
}

bool SandboxManager::RemoveLocked(const std::string& id,
                                  const std::string& reason) {
  auto it = instances_.find(id);
  if (it == instances_.end()) return false;
  Instance* instance = it->second.get();
  instance->removed = true;
  if (executor::StatusTracker::CanTransition(instance->status.status(),
                                             proto::CANCELLED))
    instance->status.Transition(proto::CANCELLED);
  if (instance->control) {
    LOG(WARNING) << "Cancelling the running execution of sandbox " << id;
    instance->control->RequestTermination(sandbox::Termination::kCancelled,
                                          reason);
  }
  instances_.erase(it);
  return true;
}

bool SandboxManager::Cleanup(const std::string& id) {
  absl::MutexLock lock(&mu_);
  if (!RemoveLocked(id, "Sandbox cleaned up")) return false;
  LOG(INFO) << "Cleaned up sandbox " << id;
  return true;
}

size_t SandboxManager::CleanupAll() {
  absl::MutexLock lock(&mu_);
  std::vector<std::string> ids;
  for (const auto& instance : instances_) ids.push_back(instance.first);
  for (const std::string& id : ids) RemoveLocked(id, "Sandbox cleaned up");
  if (!ids.empty()) LOG(INFO) << "Cleaned up " << ids.size() << " sandboxes";
  return ids.size();
}

size_t SandboxManager::Sweep() {
  int64_t now = util::NowMillis();
  absl::MutexLock lock(&mu_);
  std::vector<std::string> expired;
  for (const auto& entry : instances_) {
    const Instance& instance = *entry.second;
    if (now - instance.created_at_millis > options_.max_lifetime_millis ||
        (!instance.control &&
         now - instance.last_activity_millis > options_.idle_ttl_millis))
      expired.push_back(entry.first);
  }
  for (const std::string& id : expired) {
    LOG(INFO) << "Cleaning up expired sandbox: " << id;
    RemoveLocked(id, "Sandbox expired");
  }
  return expired.size();
}

std::vector<proto::ExecutionResult> SandboxManager::History(
    const std::string& instance_id, size_t limit) const {
  absl::MutexLock lock(&mu_);
  std::vector<proto::ExecutionResult> results;
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (results.size() >= limit) break;
    if (instance_id.empty() || it->instance_id() == instance_id)
      results.push_back(*it);
  }
  std::reverse(results.begin(), results.end());
  return results;
}

proto::MetricsSnapshot SandboxManager::Metrics() const {
  absl::MutexLock lock(&mu_);
  proto::MetricsSnapshot metrics;
  metrics.set_total_sandboxes_created(counters_.created);
  metrics.set_active_sandboxes(instances_.size());
  metrics.set_total_executions(counters_.executions);
  metrics.set_successful_executions(counters_.successful);
  metrics.set_failed_executions(counters_.failed);
  metrics.set_timeout_executions(counters_.timeouts);
  metrics.set_cancelled_executions(counters_.cancelled);
  metrics.set_validation_failures(counters_.validation_failures);
  metrics.set_monitor_terminations(counters_.monitor_terminations);
  if (counters_.executions > 0) {
    metrics.set_success_rate(static_cast<double>(counters_.successful) /
                             counters_.executions);
    metrics.set_average_execution_time(counters_.total_execution_time /
                                       counters_.executions);
  }
  metrics.set_peak_memory_bytes(counters_.peak_memory_bytes);
  metrics.set_peak_cpu_percent(counters_.peak_cpu_percent);
  *metrics.mutable_ceilings() = options_.ceilings.ToProto();
  return metrics;
}

size_t SandboxManager::size() const {
  absl::MutexLock lock(&mu_);
  return instances_.size();
}

void SandboxManager::Start() {
  monitor_.Start();
  absl::MutexLock lock(&mu_);
  if (sweeper_.joinable()) return;
  stopping_ = false;
  sweeper_ = std::thread([this]() {
    while (true) {
      {
        absl::MutexLock lock(&mu_);
        if (mu_.AwaitWithTimeout(
                absl::Condition(&stopping_),
                absl::Milliseconds(options_.sweep_interval_millis)))
          return;
      }
      Sweep();
    }
  });
  LOG(INFO) << "Sandbox manager started";
}

void SandboxManager::Stop() {
  {
    absl::MutexLock lock(&mu_);
    stopping_ = true;
  }
  if (sweeper_.joinable()) {
    sweeper_.join();
    sweeper_ = std::thread();
    LOG(INFO) << "Sandbox manager stopped";
  }
  monitor_.Stop();
}

}  // namespace manager
