#ifndef SCRIPT_FORMAT_HPP
#define SCRIPT_FORMAT_HPP

#include <string>

#include "script/value.hpp"

namespace script {

class Interpreter;
struct CallArgs;

// Formats a value with a format specification, as format(value, spec) does:
// [[fill]align][sign][#][0][width][,|_][.precision][type]. Throws
// ScriptError(ValueError) for invalid specifications.
std::string FormatValue(const Value& value, const std::string& spec);

// str.format(): positional ({} and {0}) and keyword ({name}) fields with
// optional [index] lookups, !r/!s conversions and format specs.
std::string FormatString(Interpreter* interpreter, const std::string& format,
                         const CallArgs& args);

// printf-style formatting for the "%" operator. args is a tuple of
// arguments, a dict for %(name)s fields, or a single value.
std::string PercentFormat(const std::string& format, const Value& args);

}  // namespace script

#endif
