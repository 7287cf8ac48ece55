#ifndef CAPABILITY_MODULES_HPP
#define CAPABILITY_MODULES_HPP

#include <map>
#include <string>

#include "script/interpreter.hpp"

namespace capability {

// Factories of the modules sandboxed code may import: math, json, random
// and string. Whether a given module is importable is decided by the
// sandbox policy.
const std::map<std::string, script::Interpreter::ModuleFactory>&
ModuleFactories();

}  // namespace capability

#endif
