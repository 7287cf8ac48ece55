#ifndef SANDBOX_CONTROL_HPP
#define SANDBOX_CONTROL_HPP

#include <stdint.h>

#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace sandbox {

// Why a running child was asked to stop.
enum class Termination {
  kNone,
  kCancelled,
  kTimeLimit,
  kMemoryLimit,
  kResourceLimit,
};

const char* TerminationName(Termination cause);

// Shared between the thread supervising a child and the threads that may
// want it stopped (the resource monitor, a client cancelling the instance).
// The supervisor publishes the pid once the child exists and polls for
// termination requests; everything else only calls RequestTermination.
class ExecutionControl {
 public:
  ExecutionControl() = default;
  ExecutionControl(const ExecutionControl&) = delete;
  ExecutionControl& operator=(const ExecutionControl&) = delete;

  // Returns false if termination had already been requested; the first
  // cause wins.
  bool RequestTermination(Termination cause, const std::string& reason);

  // Returns the cause of the first termination request, or kNone, and the
  // corresponding reason.
  Termination termination(std::string* reason = nullptr) const;
  int64_t termination_requested_at_millis() const;

  void SetPid(int pid);
  // 0 until the child has been created, and again after it has been reaped.
  int pid() const;
  int64_t started_at_millis() const;

 private:
  mutable absl::Mutex mu_;
  int pid_ GUARDED_BY(mu_) = 0;
  int64_t started_at_millis_ GUARDED_BY(mu_) = 0;
  Termination cause_ GUARDED_BY(mu_) = Termination::kNone;
  std::string reason_ GUARDED_BY(mu_);
  int64_t requested_at_millis_ GUARDED_BY(mu_) = 0;
};

}  // namespace sandbox

#endif
