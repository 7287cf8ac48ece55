#include "monitor/resource_monitor.hpp"

#include <dirent.h>
#include <unistd.h>

#include <fstream>
#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/time/time.h"
#include "glog/logging.h"
#include "util/misc.hpp"

namespace {

// Counts the entries of /proc/<pid>/fd. Returns -1 if it cannot be read.
int CountOpenFiles(int pid) {
  DIR* dir = opendir(("/proc/" + std::to_string(pid) + "/fd").c_str());
  if (!dir) return -1;
  int count = 0;
  while (struct dirent* entry = readdir(dir)) {
    if (entry->d_name[0] != '.') count++;
  }
  closedir(dir);
  return count;
}

// Fields of /proc/<pid>/stat after the command name; fields[0] is the
// state, the third field of the file.
bool ReadStat(int pid, std::vector<std::string>* fields) {
  std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
  std::string line;
  if (!std::getline(in, line)) return false;
  // The command name may contain spaces and parentheses.
  size_t end = line.rfind(')');
  if (end == std::string::npos) return false;
  *fields = absl::StrSplit(line.substr(end + 1), ' ', absl::SkipEmpty());
  return true;
}

// utime + stime, in clock ticks.
bool ReadCpuTicks(int pid, int64_t* ticks) {
  std::vector<std::string> fields;
  if (!ReadStat(pid, &fields)) return false;
  int64_t utime = 0;
  int64_t stime = 0;
  if (fields.size() < 13 || !absl::SimpleAtoi(fields[11], &utime) ||
      !absl::SimpleAtoi(fields[12], &stime))
    return false;
  *ticks = utime + stime;
  return true;
}

// Number of processes whose session id is sid.
int CountSessionProcesses(int sid) {
  DIR* dir = opendir("/proc");
  if (!dir) return 0;
  int count = 0;
  while (struct dirent* entry = readdir(dir)) {
    int pid = 0;
    if (!absl::SimpleAtoi(entry->d_name, &pid)) continue;
    std::vector<std::string> fields;
    int session = 0;
    if (ReadStat(pid, &fields) && fields.size() > 3 &&
        absl::SimpleAtoi(fields[3], &session) && session == sid)
      count++;
  }
  closedir(dir);
  return count;
}

}  // namespace

namespace monitor {

Limits Limits::ForConfig(const policy::SandboxConfig& config,
                         int64_t grace_millis) {
  Limits limits;
  limits.max_memory_bytes = config.max_memory_mb << 20;
  limits.max_open_files = config.max_open_files;
  limits.max_threads = config.max_threads;
  limits.max_processes = config.max_processes;
  limits.max_cpu_percent = config.max_cpu_percent;
  limits.max_runtime_millis =
      static_cast<int64_t>(config.max_execution_time * 1000) + grace_millis;
  return limits;
}

bool ProcProbe::Sample(int pid, proto::ResourceSample* sample) {
  std::ifstream status("/proc/" + std::to_string(pid) + "/status");
  if (!status) {
    Forget(pid);
    return false;
  }
  std::string line;
  while (std::getline(status, line)) {
    std::vector<std::string> fields =
        absl::StrSplit(line, absl::ByAnyChar(" \t"), absl::SkipEmpty());
    if (fields.size() < 2) continue;
    int64_t value = 0;
    if (!absl::SimpleAtoi(fields[1], &value)) continue;
    if (fields[0] == "VmRSS:") sample->set_memory_bytes(value * 1024);
    if (fields[0] == "Threads:") sample->set_threads(value);
  }
  int open_files = CountOpenFiles(pid);
  // Not readable for processes of other users: not checked then.
  if (open_files >= 0) sample->set_open_handles(open_files);

  int64_t ticks = 0;
  if (!ReadCpuTicks(pid, &ticks)) {
    Forget(pid);
    return false;
  }
  int64_t now = util::NowMillis();
  auto last = last_cpu_.find(pid);
  if (last != last_cpu_.end() && now > last->second.at_millis) {
    double seconds = (ticks - last->second.ticks) /
                     static_cast<double>(sysconf(_SC_CLK_TCK));
    sample->set_cpu_percent(100.0 * seconds * 1000 /
                            (now - last->second.at_millis));
  }
  last_cpu_[pid] = CpuReading{ticks, now};
  sample->set_processes(CountSessionProcesses(pid));
  return true;
}

void ResourceMonitor::Register(const std::string& id,
                               std::shared_ptr<sandbox::ExecutionControl> control,
                               Limits limits, SampleCallback on_sample) {
  absl::MutexLock lock(&mu_);
  Entry& entry = entries_[id];
  entry.control = std::move(control);
  entry.limits = limits;
  entry.on_sample = std::move(on_sample);
}

void ResourceMonitor::Unregister(const std::string& id) {
  absl::MutexLock sample_lock(&sample_mu_);
  int pid = 0;
  {
    absl::MutexLock lock(&mu_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return;
    pid = it->second.last_pid;
    entries_.erase(it);
  }
  if (pid) probe_->Forget(pid);
}

size_t ResourceMonitor::size() const {
  absl::MutexLock lock(&mu_);
  return entries_.size();
}

sandbox::Termination ResourceMonitor::Check(const std::string& id,
                                            const Entry& entry,
                                            const proto::ResourceSample& sample,
                                            std::string* reason) {
  const Limits& limits = entry.limits;
  if (limits.max_memory_bytes && sample.memory_bytes() > limits.max_memory_bytes) {
    LOG(WARNING) << absl::StrFormat("Sandbox %s exceeded memory limit: %.2fMB",
                                    id, sample.memory_bytes() / 1048576.0);
    *reason = "Memory limit exceeded";
    return sandbox::Termination::kMemoryLimit;
  }
  if (limits.max_cpu_percent && sample.cpu_percent() > limits.max_cpu_percent) {
    LOG(WARNING) << absl::StrFormat("Sandbox %s exceeded CPU limit: %.2f%%", id,
                                    sample.cpu_percent());
  }
  if (limits.max_open_files && sample.open_handles() > limits.max_open_files) {
    LOG(WARNING) << "Sandbox " << id
                 << " exceeded open files limit: " << sample.open_handles();
    *reason = "Open files limit exceeded";
    return sandbox::Termination::kResourceLimit;
  }
  if (limits.max_threads && sample.threads() > limits.max_threads) {
    LOG(WARNING) << "Sandbox " << id
                 << " exceeded thread limit: " << sample.threads();
    *reason = "Thread limit exceeded";
    return sandbox::Termination::kResourceLimit;
  }
  if (limits.max_processes && sample.processes() > limits.max_processes) {
    LOG(WARNING) << "Sandbox " << id
                 << " exceeded process limit: " << sample.processes();
    *reason = "Process limit exceeded";
    return sandbox::Termination::kResourceLimit;
  }
  int64_t started = entry.control->started_at_millis();
  if (limits.max_runtime_millis && started &&
      sample.timestamp_millis() - started > limits.max_runtime_millis) {
    *reason = "Execution time limit exceeded";
    return sandbox::Termination::kTimeLimit;
  }
  return sandbox::Termination::kNone;
}

void ResourceMonitor::SampleOnce() {
  absl::MutexLock sample_lock(&sample_mu_);
  std::map<std::string, Entry> entries;
  {
    absl::MutexLock lock(&mu_);
    entries = entries_;
  }
  for (auto& item : entries) {
    const std::string& id = item.first;
    Entry& entry = item.second;
    int pid = entry.control->pid();
    if (pid == 0) continue;
    {
      absl::MutexLock lock(&mu_);
      auto it = entries_.find(id);
      if (it == entries_.end()) continue;
      it->second.last_pid = pid;
    }
    proto::ResourceSample sample;
    if (!probe_->Sample(pid, &sample)) {
      VLOG(1) << "Process " << pid << " of " << id << " is gone";
      continue;
    }
    sample.set_timestamp_millis(util::NowMillis());
    std::string reason;
    sandbox::Termination termination = Check(id, entry, sample, &reason);
    if (termination != sandbox::Termination::kNone &&
        entry.control->RequestTermination(termination, reason)) {
      LOG(ERROR) << "Terminating sandbox " << id << ": " << reason;
    }
    if (entry.on_sample) entry.on_sample(sample);
  }
}

void ResourceMonitor::Start() {
  absl::MutexLock lock(&mu_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_ = std::thread([this]() {
    while (true) {
      SampleOnce();
      absl::MutexLock lock(&mu_);
      if (mu_.AwaitWithTimeout(absl::Condition(&stopping_),
                               absl::Milliseconds(interval_millis_)))
        return;
    }
  });
}

void ResourceMonitor::Stop() {
  {
    absl::MutexLock lock(&mu_);
    if (!thread_.joinable()) return;
    stopping_ = true;
  }
  thread_.join();
  absl::MutexLock lock(&mu_);
  thread_ = std::thread();
}

}  // namespace monitor
