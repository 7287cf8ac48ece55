#ifndef CAPABILITY_SURFACE_HPP
#define CAPABILITY_SURFACE_HPP

#include <set>
#include <string>

#include "capability/database.hpp"
#include "capability/output.hpp"
#include "debugger/debugger.hpp"
#include "policy/config.hpp"
#include "script/interpreter.hpp"

namespace capability {

// The complete set of names sandboxed code can reach: language primitives,
// exception classes, print, the debug helpers when debugging is enabled, the
// database helpers when a database is injected, and the importable modules
// the policy permits. Names in blocked_callables are never installed.
class CapabilitySurface {
 public:
  // debugger and database may be null. None of the pointers is owned and
  // all of them must outlive the interpreters this surface is installed in.
  CapabilitySurface(const policy::SandboxConfig& config, OutputBuffer* out,
                    debugger::Debugger* debugger, Database* database);

  void Install(script::Interpreter* interpreter) const;

  // Builtin names Install() defines.
  std::set<std::string> Names() const;
  // Modules Install() makes importable.
  std::set<std::string> Modules() const;

 private:
  bool Permitted(const std::string& name) const {
    return !config_.blocked_callables.count(name);
  }

  const policy::SandboxConfig& config_;
  OutputBuffer* out_;
  debugger::Debugger* debugger_;
  Database* database_;
};

}  // namespace capability

#endif
