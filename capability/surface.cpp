#include "capability/surface.hpp"

#include "capability/builtins.hpp"
#include "capability/modules.hpp"
#include "glog/logging.h"

namespace capability {

CapabilitySurface::CapabilitySurface(const policy::SandboxConfig& config,
                                     OutputBuffer* out,
                                     debugger::Debugger* debugger,
                                     Database* database)
    : config_(config), out_(out), debugger_(debugger), database_(database) {
  CHECK(out_ != nullptr);
}

void CapabilitySurface::Install(script::Interpreter* interpreter) const {
  Builtins builtins = Primitives();
  builtins["print"] = MakePrint(out_);
  if (config_.enable_debugging && debugger_) {
    Builtins debug = DebugBuiltins(debugger_);
    builtins.insert(debug.begin(), debug.end());
  }
  if (database_) {
    Builtins db = DatabaseBuiltins(database_);
    builtins.insert(db.begin(), db.end());
  }
  for (const std::string& name : interpreter->ExceptionClassNames())
    builtins[name] = interpreter->ExceptionClass(name);
  for (auto& builtin : builtins) {
    if (Permitted(builtin.first))
      interpreter->SetBuiltin(builtin.first, std::move(builtin.second));
  }
  for (const std::string& module : Modules())
    interpreter->RegisterModule(module, ModuleFactories().at(module));
}

std::set<std::string> CapabilitySurface::Names() const {
  std::set<std::string> names;
  for (const auto& builtin : Primitives()) names.insert(builtin.first);
  names.insert("print");
  if (config_.enable_debugging && debugger_) {
    for (const auto& builtin : DebugBuiltins(debugger_))
      names.insert(builtin.first);
  }
  if (database_) {
    for (const auto& builtin : DatabaseBuiltins(database_))
      names.insert(builtin.first);
  }
  script::Interpreter probe;
  for (const std::string& name : probe.ExceptionClassNames())
    names.insert(name);
  for (auto it = names.begin(); it != names.end();) {
    if (Permitted(*it)) {
      ++it;
    } else {
      it = names.erase(it);
    }
  }
  return names;
}

std::set<std::string> CapabilitySurface::Modules() const {
  std::set<std::string> modules;
  for (const auto& factory : ModuleFactories()) {
    if (!config_.IsModuleBlocked(factory.first) &&
        config_.IsModuleAllowed(factory.first))
      modules.insert(factory.first);
  }
  return modules;
}

}  // namespace capability
