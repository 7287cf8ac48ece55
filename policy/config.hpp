#ifndef POLICY_CONFIG_HPP
#define POLICY_CONFIG_HPP

#include <stdint.h>

#include <set>
#include <string>

#include "proto/sandbox.pb.h"

namespace policy {

// Service-wide upper bounds. Every configuration requested by a client is
// clamped to these before an instance is created.
struct ResourceCeilings {
  double max_execution_time = 300.0;
  int64_t max_memory_mb = 2048;
  double max_cpu_percent = 50.0;
  int32_t max_open_files = 100;
  int32_t max_processes = 5;
  int32_t max_threads = 10;
  int64_t max_output_bytes = 16 * 1024 * 1024;
  int64_t max_source_length = 1024 * 1024;

  static ResourceCeilings FromFlags();
  proto::ResourceCeilings ToProto() const;
};

// Resource limits and security policy of one sandbox instance. Instances
// hold it through a shared_ptr<const SandboxConfig>, so it never changes
// after creation.
struct SandboxConfig {
  // Wall-clock limit, in seconds. The CPU-time ceiling is derived from it.
  double max_execution_time = 30.0;
  int64_t max_memory_mb = 256;
  // Cap of each captured output stream.
  int64_t max_output_bytes = 1024 * 1024;
  // Empty means no allow-list.
  std::set<std::string> allowed_modules;
  std::set<std::string> blocked_modules;
  std::set<std::string> blocked_callables;
  bool enable_debugging = true;
  int64_t max_source_length = 10000;
  bool enable_file_access = false;
  bool enable_network_access = false;

  // Soft limit, only logged.
  double max_cpu_percent = 50.0;
  int32_t max_open_files = 100;
  int32_t max_processes = 5;
  int32_t max_threads = 10;
  int32_t max_recursion_depth = 100;

  // The configuration with the default module lists and the flag defaults.
  static SandboxConfig Default();

  // Builds a configuration from its wire form. Unset fields take the values
  // of Default(); blocked lists are merged with the default ones.
  static SandboxConfig FromProto(const proto::SandboxConfig& config);
  proto::SandboxConfig ToProto() const;

  // Returns a copy with every limit lowered to the given ceilings.
  SandboxConfig ClampedTo(const ResourceCeilings& ceilings) const;

  // Throws std::invalid_argument if some limit is not positive.
  void CheckValid() const;

  // Returns true if importing the dotted module name is forbidden, either
  // explicitly or because file/network access is disabled. A name listed in
  // allowed_modules overrides a rule on one of its parent packages, but not a
  // rule on the name itself.
  bool IsModuleBlocked(const std::string& module) const;

  // Returns true if the allow-list (when configured) covers the module or
  // one of its parent packages.
  bool IsModuleAllowed(const std::string& module) const;
};

// Modules that give access to the filesystem or to the network.
const std::set<std::string>& FileAccessModules();
const std::set<std::string>& NetworkAccessModules();

}  // namespace policy

#endif
