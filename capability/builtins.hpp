#ifndef CAPABILITY_BUILTINS_HPP
#define CAPABILITY_BUILTINS_HPP

#include <map>
#include <string>

#include "capability/database.hpp"
#include "capability/output.hpp"
#include "debugger/debugger.hpp"
#include "script/value.hpp"

namespace capability {

using Builtins = std::map<std::string, script::Value>;

// Conversions, iteration helpers and arithmetic functions of the language.
Builtins Primitives();

// print(*objects, sep=' ', end='\n') writing to out.
script::Value MakePrint(OutputBuffer* out);

// debug(), inspect_var() and get_debug_info().
Builtins DebugBuiltins(debugger::Debugger* recorder);

// db_query(), db_tables() and db_schema().
Builtins DatabaseBuiltins(Database* database);

}  // namespace capability

#endif
