#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems: a forked child in its own session, with
// rlimits, no inherited descriptors and no way to gain privileges.
class Unix : public Sandbox {
 public:
  Unix() = default;
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;

 private:
  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process. It must not use dynamic
  // memory allocation, since the parent may be multi-threaded.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing it if it exceeds the
  // wall time limit or if termination is requested through the control
  // block.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  int pipe_fds_[2] = {};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> args_;
};

}  // namespace sandbox
#endif
