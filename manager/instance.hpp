#ifndef MANAGER_INSTANCE_HPP
#define MANAGER_INSTANCE_HPP

#include <stdint.h>

#include <map>
#include <memory>
#include <string>

#include "capability/query_guard.hpp"
#include "debugger/debugger.hpp"
#include "executor/engine.hpp"
#include "policy/config.hpp"
#include "proto/sandbox.pb.h"
#include "proto/value.pb.h"
#include "sandbox/control.hpp"

namespace manager {

// One sandbox instance. The identity, the configuration and the database are
// fixed at creation; the debugger locks itself; everything else is guarded
// by the mutex of the SandboxManager owning the instance.
struct Instance {
  Instance(std::string id, std::string tenant_id,
           std::shared_ptr<const policy::SandboxConfig> config,
           std::shared_ptr<capability::GuardedDatabase> database, int64_t now)
      : id(std::move(id)),
        tenant_id(std::move(tenant_id)),
        config(std::move(config)),
        database(std::move(database)),
        created_at_millis(now),
        last_activity_millis(now) {}
  Instance(const Instance&) = delete;
  Instance& operator=(const Instance&) = delete;

  const std::string id;
  const std::string tenant_id;
  const std::shared_ptr<const policy::SandboxConfig> config;
  // Null when the instance has no database.
  const std::shared_ptr<capability::GuardedDatabase> database;
  const int64_t created_at_millis;
  debugger::Debugger debugger;

  executor::StatusTracker status;
  int64_t last_activity_millis;
  int64_t execution_count = 0;
  // Data-valued globals left by the last completed execution.
  std::map<std::string, proto::Value> session;
  // Set while an execution is running.
  std::shared_ptr<sandbox::ExecutionControl> control;
  proto::ResourceSample last_sample;

  // Executions are served in the order of their tickets.
  uint64_t next_ticket = 0;
  uint64_t now_serving = 0;
  // Set by Cleanup; waiting executions give up.
  bool removed = false;
};

}  // namespace manager

#endif
