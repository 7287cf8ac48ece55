#ifndef VALIDATOR_VALIDATOR_HPP
#define VALIDATOR_VALIDATOR_HPP

#include <memory>
#include <string>

#include "policy/config.hpp"
#include "script/ast.hpp"

namespace validator {

enum class ErrorKind {
  kSourceTooLong,
  kSyntaxInvalid,
  kBlockedModule,
  kModuleNotAllowed,
  kBlockedCallable,
  kBlockedAttribute
};

const char* ErrorKindName(ErrorKind kind);

struct ValidationError {
  ErrorKind kind = ErrorKind::kSyntaxInvalid;
  std::string message;
  // Position of the offending node, 0 when not applicable.
  int line = 0;
  int column = 0;
};

// Statically checks source against the policy of config: size, syntax,
// imports, references to blocked callables and dunder attributes. Returns
// false and fills error with the first violation found, in source order.
bool Validate(const std::string& source, const policy::SandboxConfig& config,
              ValidationError* error);

// As above, also returning the parsed program when validation succeeds so
// that callers do not parse twice.
bool Validate(const std::string& source, const policy::SandboxConfig& config,
              ValidationError* error,
              std::shared_ptr<const script::ast::Module>* program);

}  // namespace validator

#endif
