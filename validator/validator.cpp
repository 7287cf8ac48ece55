#include "validator/validator.hpp"

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "script/errors.hpp"
#include "script/interpreter.hpp"
#include "script/parser.hpp"

namespace validator {

namespace {

namespace ast = script::ast;

bool IsDunder(const std::string& name) {
  return name.size() > 4 && name.compare(0, 2, "__") == 0 &&
         name.compare(name.size() - 2, 2, "__") == 0;
}

class PolicyChecker : public ast::Visitor {
 public:
  explicit PolicyChecker(const policy::SandboxConfig& config)
      : config_(config) {}

  void VisitStmt(const ast::Stmt& stmt) override {
    if (failed_) return;
    switch (stmt.kind) {
      case ast::StmtKind::kImport:
        for (const ast::Alias& alias :
             static_cast<const ast::Import&>(stmt).names) {
          CheckModule(alias.name, stmt);
        }
        break;
      case ast::StmtKind::kImportFrom:
        CheckModule(static_cast<const ast::ImportFrom&>(stmt).module, stmt);
        break;
      case ast::StmtKind::kFunctionDef: {
        const auto& def = static_cast<const ast::FunctionDef&>(stmt);
        if (config_.blocked_callables.count(def.name))
          Fail(ErrorKind::kBlockedCallable,
               "redefinition of blocked function '" + def.name + "'", stmt);
        break;
      }
      default:
        break;
    }
  }

  void VisitExpr(const ast::Expr& expr) override {
    if (failed_) return;
    if (expr.kind == ast::ExprKind::kName) {
      // Any reference counts: "f = eval" would otherwise bypass a check
      // limited to calls.
      const std::string& id = static_cast<const ast::Name&>(expr).id;
      if (config_.blocked_callables.count(id))
        Fail(ErrorKind::kBlockedCallable,
             "use of blocked function '" + id + "'", expr);
    } else if (expr.kind == ast::ExprKind::kAttribute) {
      const std::string& attr = static_cast<const ast::Attribute&>(expr).attr;
      if (IsDunder(attr))
        Fail(ErrorKind::kBlockedAttribute,
             "access to attribute '" + attr + "' is not allowed", expr);
    }
  }

  bool failed() const { return failed_; }
  const ValidationError& error() const { return error_; }

 private:
  void CheckModule(const std::string& module, const ast::Node& node) {
    if (config_.IsModuleBlocked(module)) {
      Fail(ErrorKind::kBlockedModule,
           "import of module '" + module + "' is blocked", node);
    } else if (!config_.IsModuleAllowed(module)) {
      Fail(ErrorKind::kModuleNotAllowed,
           "module '" + module + "' is not in the allowed list", node);
    }
  }

  void Fail(ErrorKind kind, const std::string& message,
            const ast::Node& node) {
    if (failed_) return;
    failed_ = true;
    error_.kind = kind;
    error_.message = message;
    error_.line = node.line;
    error_.column = node.column;
  }

  const policy::SandboxConfig& config_;
  bool failed_ = false;
  ValidationError error_;
};

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kSourceTooLong:
      return "SOURCE_TOO_LONG";
    case ErrorKind::kSyntaxInvalid:
      return "SYNTAX_INVALID";
    case ErrorKind::kBlockedModule:
      return "BLOCKED_MODULE";
    case ErrorKind::kModuleNotAllowed:
      return "MODULE_NOT_ALLOWED";
    case ErrorKind::kBlockedCallable:
      return "BLOCKED_CALLABLE";
    case ErrorKind::kBlockedAttribute:
      return "BLOCKED_ATTRIBUTE";
  }
  return "UNKNOWN";
}

bool Validate(const std::string& source, const policy::SandboxConfig& config,
              ValidationError* error) {
  return Validate(source, config, error, nullptr);
}

bool Validate(const std::string& source, const policy::SandboxConfig& config,
              ValidationError* error,
              std::shared_ptr<const script::ast::Module>* program) {
  int64_t length = script::CodePointCount(source);
  if (length > config.max_source_length) {
    error->kind = ErrorKind::kSourceTooLong;
    error->message =
        absl::StrCat("source is ", length, " characters long, the limit is ",
                     config.max_source_length);
    error->line = error->column = 0;
    return false;
  }
  std::shared_ptr<const ast::Module> module;
  try {
    module = script::Parse(source);
  } catch (const script::SyntaxError& e) {
    error->kind = ErrorKind::kSyntaxInvalid;
    error->message = absl::StrCat("syntax error at line ", e.line(),
                                  ", column ", e.column(), ": ", e.what());
    error->line = e.line();
    error->column = e.column();
    return false;
  }
  PolicyChecker checker(config);
  ast::Walk(*module, &checker);
  if (checker.failed()) {
    *error = checker.error();
    VLOG(1) << "Rejected source: " << ErrorKindName(error->kind) << ": "
            << error->message;
    return false;
  }
  if (program) *program = std::move(module);
  return true;
}

}  // namespace validator
