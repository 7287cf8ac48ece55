#include "sandbox/control.hpp"

#include "util/misc.hpp"

namespace sandbox {

const char* TerminationName(Termination cause) {
  switch (cause) {
    case Termination::kNone:
      return "none";
    case Termination::kCancelled:
      return "cancelled";
    case Termination::kTimeLimit:
      return "time limit";
    case Termination::kMemoryLimit:
      return "memory limit";
    case Termination::kResourceLimit:
      return "resource limit";
  }
  return "unknown";
}

bool ExecutionControl::RequestTermination(Termination cause,
                                          const std::string& reason) {
  absl::MutexLock lock(&mu_);
  if (cause_ != Termination::kNone) return false;
  cause_ = cause;
  reason_ = reason;
  requested_at_millis_ = util::NowMillis();
  return true;
}

Termination ExecutionControl::termination(std::string* reason) const {
  absl::MutexLock lock(&mu_);
  if (reason) *reason = reason_;
  return cause_;
}

int64_t ExecutionControl::termination_requested_at_millis() const {
  absl::MutexLock lock(&mu_);
  return requested_at_millis_;
}

void ExecutionControl::SetPid(int pid) {
  absl::MutexLock lock(&mu_);
  pid_ = pid;
  if (pid) started_at_millis_ = util::NowMillis();
}

int ExecutionControl::pid() const {
  absl::MutexLock lock(&mu_);
  return pid_;
}

int64_t ExecutionControl::started_at_millis() const {
  absl::MutexLock lock(&mu_);
  return started_at_millis_;
}

}  // namespace sandbox
