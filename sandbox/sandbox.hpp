#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "sandbox/control.hpp"

namespace sandbox {

// Descriptor number the IPC channel gets in the child.
static const constexpr int kChannelFd = 3;

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_stack_kb = 0;

  // Unset streams are connected to /dev/null.
  std::string stdin_file = "";
  std::string stdout_file = "";
  std::string stderr_file = "";
  std::vector<std::string> args;

  // One end of a socket pair that the child gets as kChannelFd, or -1. No
  // other descriptor survives in the child.
  int channel_fd = -1;

  // Time between SIGTERM and SIGKILL when termination is requested through
  // control.
  int64_t kill_grace_millis = 5000;
  // Receives the pid of the child and is polled for termination requests.
  std::shared_ptr<ExecutionControl> control;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // The child was killed for running past wall_limit_millis.
  bool wall_limit_exceeded = false;
  // The child was stopped because of a request made through control.
  Termination termination = Termination::kNone;
  std::string termination_reason;
};

// Sandbox interface. Create returns the implementation for the current
// platform.
class Sandbox {
 public:
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
};

}  // namespace sandbox

#endif
