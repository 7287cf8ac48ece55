#ifndef EXECUTOR_ENGINE_HPP
#define EXECUTOR_ENGINE_HPP

#include <stdint.h>

#include <map>
#include <memory>
#include <string>

#include "capability/database.hpp"
#include "debugger/debugger.hpp"
#include "policy/config.hpp"
#include "proto/sandbox.pb.h"
#include "proto/value.pb.h"
#include "sandbox/control.hpp"

namespace executor {

// The execution state machine: CREATED -> RUNNING -> one of the terminal
// states. CANCELLED is also reachable from CREATED and is final; the other
// terminal states may go back to RUNNING for the next execution.
class StatusTracker {
 public:
  explicit StatusTracker(proto::Status initial = proto::CREATED)
      : status_(initial) {}

  proto::Status status() const { return status_; }

  // Throws std::logic_error if the transition is not legal.
  void Transition(proto::Status to);

  static bool IsTerminal(proto::Status status);
  static bool CanTransition(proto::Status from, proto::Status to);

 private:
  proto::Status status_;
};

struct ExecutionRequest {
  std::string execution_id;
  std::string instance_id;
  std::string tenant_id;
  std::shared_ptr<const policy::SandboxConfig> config;
  std::string source;
  // Injected as globals before the script runs.
  std::map<std::string, proto::Value> globals;

  // Optional. Not owned.
  capability::Database* database = nullptr;
  debugger::Debugger* debugger = nullptr;
  // Lets other threads stop the execution; one is created if missing.
  std::shared_ptr<sandbox::ExecutionControl> control;
};

struct EngineOptions {
  std::string worker_path;
  int64_t kill_grace_millis = 5000;
};

// Returns the path of codebox-worker: --worker_path if set, else the binary
// next to the running executable, else the first one in PATH.
std::string FindWorker();

// Validates and runs scripts, each one in a fresh sandboxed worker process.
class ExecutionEngine {
 public:
  explicit ExecutionEngine(EngineOptions options)
      : options_(std::move(options)) {}
  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;

  // Always returns a result in a terminal state. When the script completes,
  // session (if not null) is replaced with the data-valued globals it left
  // behind. Thread-safe: executions run in parallel.
  proto::ExecutionResult Execute(
      const ExecutionRequest& request,
      std::map<std::string, proto::Value>* session = nullptr) const;

 private:
  EngineOptions options_;
};

}  // namespace executor

#endif
