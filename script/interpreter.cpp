#include "script/interpreter.hpp"

#include <algorithm>
#include <cmath>
#include <new>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "script/format.hpp"

namespace script {

volatile sig_atomic_t Interpreter::interrupt_requested_ = 0;

namespace {

ScriptError TypeError(const std::string& msg) {
  return ScriptError("TypeError", msg);
}

ScriptError Overflow() {
  return ScriptError("OverflowError", "integer overflow");
}

bool IsDunder(const std::string& name) {
  return name.size() > 4 && name.compare(0, 2, "__") == 0 &&
         name.compare(name.size() - 2, 2, "__") == 0;
}

// "is" semantics: same object, or same scalar.
bool Same(const Value& a, const Value& b) {
  if (a.type() != b.type()) return false;
  if (a.identity() || b.identity()) return a.identity() == b.identity();
  return a.int_value() == b.int_value() &&
         (a.float_value() == b.float_value() ||
          (std::isnan(a.float_value()) && std::isnan(b.float_value())));
}

const char* OpSymbol(ast::BinOp op) {
  switch (op) {
    case ast::BinOp::kAdd:
      return "+";
    case ast::BinOp::kSub:
      return "-";
    case ast::BinOp::kMul:
      return "*";
    case ast::BinOp::kDiv:
      return "/";
    case ast::BinOp::kFloorDiv:
      return "//";
    case ast::BinOp::kMod:
      return "%";
    case ast::BinOp::kPow:
      return "**";
    case ast::BinOp::kBitAnd:
      return "&";
    case ast::BinOp::kBitOr:
      return "|";
    case ast::BinOp::kBitXor:
      return "^";
    case ast::BinOp::kLShift:
      return "<<";
    case ast::BinOp::kRShift:
      return ">>";
  }
  return "?";
}

ScriptError Unsupported(ast::BinOp op, const Value& a, const Value& b) {
  return TypeError(absl::StrCat("unsupported operand type(s) for ",
                                OpSymbol(op), ": '", TypeName(a), "' and '",
                                TypeName(b), "'"));
}

// Repeats a sequence n times, as in [0] * n.
template <typename T>
T Repeat(const T& items, int64_t n) {
  T out;
  if (n <= 0 || items.empty()) return out;
  if (static_cast<uint64_t>(n) > out.max_size() / items.size())
    throw std::bad_alloc();
  out.reserve(items.size() * n);
  for (int64_t i = 0; i < n; i++) out.insert(out.end(), items.begin(), items.end());
  return out;
}

int64_t IntPow(int64_t base, int64_t exp) {
  int64_t result = 1;
  while (exp > 0) {
    if (exp & 1) {
      if (__builtin_mul_overflow(result, base, &result)) throw Overflow();
    }
    exp >>= 1;
    if (exp > 0 && __builtin_mul_overflow(base, base, &base)) throw Overflow();
  }
  return result;
}

Value FloatOp(ast::BinOp op, double x, double y) {
  switch (op) {
    case ast::BinOp::kAdd:
      return Value::Float(x + y);
    case ast::BinOp::kSub:
      return Value::Float(x - y);
    case ast::BinOp::kMul:
      return Value::Float(x * y);
    case ast::BinOp::kDiv:
      if (y == 0) throw ScriptError("ZeroDivisionError", "float division by zero");
      return Value::Float(x / y);
    case ast::BinOp::kFloorDiv:
      if (y == 0) throw ScriptError("ZeroDivisionError", "float floor division by zero");
      return Value::Float(std::floor(x / y));
    case ast::BinOp::kMod: {
      if (y == 0) throw ScriptError("ZeroDivisionError", "float modulo");
      double r = std::fmod(x, y);
      if (r != 0 && ((r < 0) != (y < 0))) r += y;
      return Value::Float(r);
    }
    case ast::BinOp::kPow: {
      if (x == 0 && y < 0)
        throw ScriptError("ZeroDivisionError",
                          "0.0 cannot be raised to a negative power");
      if (x < 0 && y != std::floor(y))
        throw ScriptError("ValueError", "math domain error");
      double r = std::pow(x, y);
      if (std::isinf(r) && std::isfinite(x) && std::isfinite(y))
        throw ScriptError("OverflowError", "numerical result out of range");
      return Value::Float(r);
    }
    default:
      return Value();
  }
}

Value IntOp(ast::BinOp op, int64_t x, int64_t y) {
  int64_t r;
  switch (op) {
    case ast::BinOp::kAdd:
      if (__builtin_add_overflow(x, y, &r)) throw Overflow();
      return Value::Int(r);
    case ast::BinOp::kSub:
      if (__builtin_sub_overflow(x, y, &r)) throw Overflow();
      return Value::Int(r);
    case ast::BinOp::kMul:
      if (__builtin_mul_overflow(x, y, &r)) throw Overflow();
      return Value::Int(r);
    case ast::BinOp::kDiv:
      if (y == 0) throw ScriptError("ZeroDivisionError", "division by zero");
      return Value::Float(static_cast<double>(x) / static_cast<double>(y));
    case ast::BinOp::kFloorDiv: {
      if (y == 0)
        throw ScriptError("ZeroDivisionError",
                          "integer division or modulo by zero");
      if (x == INT64_MIN && y == -1) throw Overflow();
      int64_t q = x / y;
      if (x % y != 0 && ((x < 0) != (y < 0))) q--;
      return Value::Int(q);
    }
    case ast::BinOp::kMod: {
      if (y == 0)
        throw ScriptError("ZeroDivisionError",
                          "integer division or modulo by zero");
      if (y == -1) return Value::Int(0);
      int64_t m = x % y;
      if (m != 0 && ((m < 0) != (y < 0))) m += y;
      return Value::Int(m);
    }
    case ast::BinOp::kPow:
      if (y < 0) return FloatOp(op, static_cast<double>(x), static_cast<double>(y));
      return Value::Int(IntPow(x, y));
    case ast::BinOp::kBitAnd:
      return Value::Int(x & y);
    case ast::BinOp::kBitOr:
      return Value::Int(x | y);
    case ast::BinOp::kBitXor:
      return Value::Int(x ^ y);
    case ast::BinOp::kLShift:
      if (y < 0) throw ScriptError("ValueError", "negative shift count");
      if (x == 0) return Value::Int(0);
      if (y >= 63) throw Overflow();
      r = static_cast<int64_t>(static_cast<uint64_t>(x) << y);
      if ((r >> y) != x) throw Overflow();
      return Value::Int(r);
    case ast::BinOp::kRShift:
      if (y < 0) throw ScriptError("ValueError", "negative shift count");
      if (y >= 64) return Value::Int(x < 0 ? -1 : 0);
      return Value::Int(x >> y);
  }
  return Value();
}

// Restores the handling stack when leaving an except block.
class HandlingGuard {
 public:
  HandlingGuard(std::vector<ScriptError>* stack, const ScriptError& error)
      : stack_(stack) {
    stack_->push_back(error);
  }
  ~HandlingGuard() { stack_->pop_back(); }
  HandlingGuard(const HandlingGuard&) = delete;
  HandlingGuard& operator=(const HandlingGuard&) = delete;

 private:
  std::vector<ScriptError>* stack_;
};

}  // namespace

class Interpreter::FrameGuard {
 public:
  FrameGuard(Interpreter* interpreter, std::string function, int line,
             std::shared_ptr<Scope> scope)
      : interpreter_(interpreter), saved_scope_(interpreter->scope_) {
    interpreter_->frames_.push_back(Frame{std::move(function), line, scope});
    interpreter_->scope_ = std::move(scope);
    interpreter_->call_depth_++;
  }
  ~FrameGuard() {
    interpreter_->call_depth_--;
    interpreter_->frames_.pop_back();
    interpreter_->scope_ = std::move(saved_scope_);
  }
  FrameGuard(const FrameGuard&) = delete;
  FrameGuard& operator=(const FrameGuard&) = delete;

 private:
  Interpreter* interpreter_;
  std::shared_ptr<Scope> saved_scope_;
};

class Interpreter::ScopeGuard {
 public:
  ScopeGuard(Interpreter* interpreter, std::shared_ptr<Scope> scope)
      : interpreter_(interpreter), saved_scope_(interpreter->scope_) {
    interpreter_->scope_ = std::move(scope);
  }
  ~ScopeGuard() { interpreter_->scope_ = std::move(saved_scope_); }
  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

 private:
  Interpreter* interpreter_;
  std::shared_ptr<Scope> saved_scope_;
};

const Value* CallArgs::Get(size_t position, const char* name) const {
  if (position < args.size()) return &args[position];
  if (name) {
    for (const auto& kwarg : kwargs) {
      if (kwarg.first == name) return &kwarg.second;
    }
  }
  return nullptr;
}

void CallArgs::Check(const char* function, size_t min, size_t max,
                     const std::set<std::string>& keywords) const {
  for (const auto& kwarg : kwargs) {
    if (!keywords.count(kwarg.first))
      throw TypeError(absl::StrCat(function,
                                   "() got an unexpected keyword argument '",
                                   kwarg.first, "'"));
  }
  size_t given = args.size() + kwargs.size();
  if (args.size() > max) {
    throw TypeError(absl::StrCat(function, "() takes at most ", max,
                                 " argument", max == 1 ? "" : "s", " (",
                                 args.size(), " given)"));
  }
  if (given < min) {
    throw TypeError(absl::StrCat(function, "() takes at least ", min,
                                 " argument", min == 1 ? "" : "s", " (",
                                 given, " given)"));
  }
}

Interpreter::Interpreter(int max_recursion_depth)
    : globals_(std::make_shared<Scope>(nullptr)),
      scope_(globals_),
      max_recursion_depth_(max_recursion_depth) {
  frames_.push_back(Frame{"<module>", 0, globals_});
  classes_["BaseException"] =
      std::make_shared<ClassObject>("BaseException", nullptr);
  static const char* const kHierarchy[][2] = {
      {"Exception", "BaseException"},
      {"ArithmeticError", "Exception"},
      {"ZeroDivisionError", "ArithmeticError"},
      {"OverflowError", "ArithmeticError"},
      {"LookupError", "Exception"},
      {"KeyError", "LookupError"},
      {"IndexError", "LookupError"},
      {"ValueError", "Exception"},
      {"TypeError", "Exception"},
      {"NameError", "Exception"},
      {"AttributeError", "Exception"},
      {"RuntimeError", "Exception"},
      {"RecursionError", "RuntimeError"},
      {"NotImplementedError", "RuntimeError"},
      {"ImportError", "Exception"},
      {"ModuleNotFoundError", "ImportError"},
      {"AssertionError", "Exception"},
      {"StopIteration", "Exception"},
      {"SyntaxError", "Exception"}};
  for (const auto& entry : kHierarchy) ExceptionClass(entry[0], entry[1]);
}

void Interpreter::SetBuiltin(const std::string& name, Value value) {
  builtins_[name] = std::move(value);
}

void Interpreter::RemoveBuiltin(const std::string& name) {
  builtins_.erase(name);
}

void Interpreter::RegisterModule(const std::string& name,
                                 ModuleFactory factory) {
  module_factories_[name] = std::move(factory);
  modules_.erase(name);
}

void Interpreter::SetGlobal(const std::string& name, Value value) {
  globals_->vars[name] = std::move(value);
}

bool Interpreter::GetGlobal(const std::string& name, Value* value) const {
  auto it = globals_->vars.find(name);
  if (it == globals_->vars.end()) return false;
  *value = it->second;
  return true;
}

Value Interpreter::ExceptionClass(const std::string& name,
                                  const std::string& base) {
  auto it = classes_.find(name);
  if (it == classes_.end()) {
    auto parent = classes_.find(base);
    std::shared_ptr<ClassObject> base_class =
        parent == classes_.end() ? classes_["Exception"] : parent->second;
    it = classes_
             .emplace(name, std::make_shared<ClassObject>(name, base_class))
             .first;
  }
  return Value::FromObject(Type::kClass, it->second);
}

std::vector<std::string> Interpreter::ExceptionClassNames() const {
  std::vector<std::string> names;
  for (const auto& entry : classes_) names.push_back(entry.first);
  return names;
}

void Interpreter::Run(std::shared_ptr<const ast::Module> program) {
  program_ = std::move(program);
  scope_ = globals_;
  frames_.resize(1);
  frames_[0].line = 0;
  call_depth_ = 0;
  try {
    ExecBlock(program_->body);
  } catch (ScriptError& e) {
    e.AddFrame("<module>", frames_[0].line);
    throw;
  }
}

Interpreter::Flow Interpreter::ExecBlock(const ast::Body& body) {
  for (const ast::StmtPtr& stmt : body) {
    Flow flow = Exec(*stmt);
    if (flow != Flow::kNormal) return flow;
  }
  return Flow::kNormal;
}

Interpreter::Flow Interpreter::Exec(const ast::Stmt& stmt) {
  CheckInterrupt();
  frames_.back().line = stmt.line;
  switch (stmt.kind) {
    case ast::StmtKind::kExpr:
      Eval(*static_cast<const ast::ExprStmt&>(stmt).value);
      return Flow::kNormal;
    case ast::StmtKind::kAssign: {
      const auto& node = static_cast<const ast::Assign&>(stmt);
      Value value = Eval(*node.value);
      for (const ast::ExprPtr& target : node.targets) Assign(*target, value);
      return Flow::kNormal;
    }
    case ast::StmtKind::kAugAssign: {
      const auto& node = static_cast<const ast::AugAssign&>(stmt);
      const ast::Expr& target = *node.target;
      if (target.kind == ast::ExprKind::kName) {
        const auto& name = static_cast<const ast::Name&>(target);
        Value current = EvalName(name);
        Value rhs = Eval(*node.value);
        if (node.op == ast::BinOp::kAdd && current.is_list()) {
          // In place, so aliases of the list see the change.
          std::vector<Value> extra = ToVector(rhs);
          current.items().insert(current.items().end(), extra.begin(),
                                 extra.end());
          AssignName(name.id, current);
        } else {
          AssignName(name.id, BinaryOp(node.op, current, rhs));
        }
      } else if (target.kind == ast::ExprKind::kSubscript) {
        const auto& sub = static_cast<const ast::Subscript&>(target);
        if (sub.index->kind == ast::ExprKind::kSlice)
          throw TypeError("augmented assignment to a slice is not supported");
        Value object = Eval(*sub.value);
        Value index = Eval(*sub.index);
        Value current = GetItem(object, index);
        SetItem(object, index,
                BinaryOp(node.op, current, Eval(*node.value)));
      } else {
        const auto& attr = static_cast<const ast::Attribute&>(target);
        SetAttr(Eval(*attr.value), attr.attr);
      }
      return Flow::kNormal;
    }
    case ast::StmtKind::kIf: {
      const auto& node = static_cast<const ast::If&>(stmt);
      return ExecBlock(Truthy(Eval(*node.test)) ? node.body : node.orelse);
    }
    case ast::StmtKind::kWhile:
      return ExecWhile(static_cast<const ast::While&>(stmt));
    case ast::StmtKind::kFor:
      return ExecFor(static_cast<const ast::For&>(stmt));
    case ast::StmtKind::kBreak:
      return Flow::kBreak;
    case ast::StmtKind::kContinue:
      return Flow::kContinue;
    case ast::StmtKind::kPass:
      return Flow::kNormal;
    case ast::StmtKind::kFunctionDef:
      DefineFunction(static_cast<const ast::FunctionDef&>(stmt));
      return Flow::kNormal;
    case ast::StmtKind::kReturn: {
      const auto& node = static_cast<const ast::Return&>(stmt);
      return_value_ = node.value ? Eval(*node.value) : Value::None();
      return Flow::kReturn;
    }
    case ast::StmtKind::kImport:
      ExecImport(static_cast<const ast::Import&>(stmt));
      return Flow::kNormal;
    case ast::StmtKind::kImportFrom:
      ExecImportFrom(static_cast<const ast::ImportFrom&>(stmt));
      return Flow::kNormal;
    case ast::StmtKind::kTry:
      return ExecTry(static_cast<const ast::Try&>(stmt));
    case ast::StmtKind::kRaise:
      ExecRaise(static_cast<const ast::Raise&>(stmt));
      return Flow::kNormal;
    case ast::StmtKind::kAssert: {
      const auto& node = static_cast<const ast::Assert&>(stmt);
      if (!Truthy(Eval(*node.test))) {
        throw ScriptError("AssertionError",
                          node.msg ? Str(Eval(*node.msg)) : "");
      }
      return Flow::kNormal;
    }
    case ast::StmtKind::kDelete:
      for (const ast::ExprPtr& target :
           static_cast<const ast::Delete&>(stmt).targets)
        ExecDelete(*target);
      return Flow::kNormal;
    case ast::StmtKind::kGlobal:
      if (scope_ != globals_) {
        for (const std::string& name :
             static_cast<const ast::Global&>(stmt).names)
          scope_->global_names.insert(name);
      }
      return Flow::kNormal;
  }
  return Flow::kNormal;
}

Interpreter::Flow Interpreter::ExecWhile(const ast::While& node) {
  while (Truthy(Eval(*node.test))) {
    CheckInterrupt();
    Flow flow = ExecBlock(node.body);
    if (flow == Flow::kBreak) return Flow::kNormal;
    if (flow == Flow::kReturn) return flow;
  }
  return ExecBlock(node.orelse);
}

Interpreter::Flow Interpreter::ExecFor(const ast::For& node) {
  Value iterable = Eval(*node.iter);
  bool broke = false;
  bool returned = false;
  ForEach(iterable, [&](const Value& item) {
    Assign(*node.target, item);
    Flow flow = ExecBlock(node.body);
    if (flow == Flow::kBreak) {
      broke = true;
      return false;
    }
    if (flow == Flow::kReturn) {
      returned = true;
      return false;
    }
    return true;
  });
  if (returned) return Flow::kReturn;
  if (broke) return Flow::kNormal;
  return ExecBlock(node.orelse);
}

Interpreter::Flow Interpreter::ExecTry(const ast::Try& node) {
  Flow flow;
  try {
    flow = ExecTryHandlers(node);
  } catch (ScriptError&) {
    if (!node.finalbody.empty()) {
      // A return or break in finally discards the exception.
      Flow final_flow = ExecBlock(node.finalbody);
      if (final_flow != Flow::kNormal) return final_flow;
    }
    throw;
  }
  if (!node.finalbody.empty()) {
    Value saved = return_value_;
    Flow final_flow = ExecBlock(node.finalbody);
    if (final_flow != Flow::kNormal) return final_flow;
    return_value_ = std::move(saved);
  }
  return flow;
}

Interpreter::Flow Interpreter::ExecTryHandlers(const ast::Try& node) {
  Flow flow;
  try {
    flow = ExecBlock(node.body);
  } catch (ScriptError& e) {
    for (const ast::Handler& handler : node.handlers) {
      if (handler.type && !Matches(e, Eval(*handler.type))) continue;
      HandlingGuard guard(&handling_, e);
      if (!handler.name.empty()) AssignName(handler.name, Materialize(e));
      frames_.back().line = handler.line;
      Flow handler_flow = ExecBlock(handler.body);
      if (!handler.name.empty()) {
        Scope* scope = scope_->global_names.count(handler.name)
                           ? globals_.get()
                           : scope_.get();
        scope->vars.erase(handler.name);
      }
      return handler_flow;
    }
    throw;
  }
  if (flow == Flow::kNormal) return ExecBlock(node.orelse);
  return flow;
}

bool Interpreter::Matches(const ScriptError& error, const Value& cls) {
  if (cls.is_tuple()) {
    for (const Value& item : cls.items()) {
      if (Matches(error, item)) return true;
    }
    return false;
  }
  if (cls.type() != Type::kClass)
    throw TypeError(
        "catching classes that do not inherit from BaseException is not "
        "allowed");
  const ClassObject* raised =
      ExceptionClass(error.type()).object<ClassObject>();
  return raised->IsSubclassOf(cls.object<ClassObject>());
}

Value Interpreter::Materialize(const ScriptError& error) {
  if (!error.exception().is_none()) return error.exception();
  ExceptionClass(error.type());
  std::vector<Value> args;
  if (!error.message().empty()) args.push_back(Value::Str(error.message()));
  return Value::FromObject(
      Type::kException,
      std::make_shared<ExceptionObject>(classes_[error.type()],
                                        std::move(args)));
}

void Interpreter::ExecRaise(const ast::Raise& node) {
  if (!node.exc) {
    if (handling_.empty())
      throw ScriptError("RuntimeError", "No active exception to reraise");
    throw handling_.back();
  }
  Value exc = Eval(*node.exc);
  if (node.cause) Eval(*node.cause);
  if (exc.type() == Type::kClass) exc = Call(exc, CallArgs());
  if (exc.type() != Type::kException)
    throw TypeError("exceptions must derive from BaseException");
  const auto* object = exc.object<ExceptionObject>();
  throw ScriptError(object->cls->name, object->Message(), exc);
}

Value Interpreter::ImportModule(const std::string& name) {
  auto it = modules_.find(name);
  if (it != modules_.end()) return it->second;
  auto factory = module_factories_.find(name);
  if (factory == module_factories_.end())
    throw ScriptError("ModuleNotFoundError", "No module named '" + name + "'");
  Value module = factory->second(this);
  modules_[name] = module;
  return module;
}

void Interpreter::ExecImport(const ast::Import& node) {
  for (const ast::Alias& alias : node.names) {
    Value module = ImportModule(alias.name);
    if (!alias.asname.empty()) {
      AssignName(alias.asname, module);
      continue;
    }
    size_t dot = alias.name.find('.');
    if (dot == std::string::npos) {
      AssignName(alias.name, module);
    } else {
      std::string top = alias.name.substr(0, dot);
      AssignName(top, ImportModule(top));
    }
  }
}

void Interpreter::ExecImportFrom(const ast::ImportFrom& node) {
  Value module = ImportModule(node.module);
  const auto& attributes = module.object<ModuleObject>()->attributes;
  for (const ast::Alias& alias : node.names) {
    if (alias.name == "*") {
      for (const auto& entry : attributes) {
        if (entry.first[0] != '_') AssignName(entry.first, entry.second);
      }
      continue;
    }
    auto it = attributes.find(alias.name);
    if (it == attributes.end())
      throw ScriptError("ImportError", "cannot import name '" + alias.name +
                                           "' from '" + node.module + "'");
    AssignName(alias.asname.empty() ? alias.name : alias.asname, it->second);
  }
}

void Interpreter::DefineFunction(const ast::FunctionDef& node) {
  Value function = MakeFunction(node.name, node.signature);
  function.object<UserFunction>()->body = &node.body;
  AssignName(node.name, function);
}

Value Interpreter::MakeFunction(std::string name,
                                const ast::Signature& signature) {
  auto function = std::make_shared<UserFunction>(std::move(name), program_);
  function->signature = &signature;
  function->closure = scope_;
  for (const ast::Param& param : signature.params) {
    function->defaults.push_back(param.default_value
                                     ? Eval(*param.default_value)
                                     : Value::None());
  }
  return Value::FromObject(Type::kFunction, function);
}

void Interpreter::ExecDelete(const ast::Expr& target) {
  switch (target.kind) {
    case ast::ExprKind::kName: {
      const std::string& id = static_cast<const ast::Name&>(target).id;
      Scope* scope =
          scope_->global_names.count(id) ? globals_.get() : scope_.get();
      if (!scope->vars.erase(id))
        throw ScriptError("NameError", "name '" + id + "' is not defined");
      return;
    }
    case ast::ExprKind::kSubscript: {
      const auto& sub = static_cast<const ast::Subscript&>(target);
      Value object = Eval(*sub.value);
      if (sub.index->kind == ast::ExprKind::kSlice) {
        if (!object.is_list())
          throw TypeError("'" + TypeName(object) +
                          "' object does not support item deletion");
        const auto& slice = static_cast<const ast::Slice&>(*sub.index);
        Value lower = slice.lower ? Eval(*slice.lower) : Value::None();
        Value upper = slice.upper ? Eval(*slice.upper) : Value::None();
        Value step = slice.step ? Eval(*slice.step) : Value::None();
        std::vector<Value>& items = object.items();
        std::vector<int64_t> indices =
            SliceIndices(lower, upper, step, items.size());
        std::vector<bool> drop(items.size(), false);
        for (int64_t i : indices) drop[i] = true;
        std::vector<Value> kept;
        for (size_t i = 0; i < items.size(); i++) {
          if (!drop[i]) kept.push_back(std::move(items[i]));
        }
        items = std::move(kept);
        return;
      }
      Value index = Eval(*sub.index);
      if (object.is_dict()) {
        if (!object.dict().Erase(index))
          throw ScriptError("KeyError", Repr(index));
      } else if (object.is_list()) {
        std::vector<Value>& items = object.items();
        int64_t i = NormalizeIndex(
            ToIndex(index, "list indices must be integers or slices"),
            items.size(), "list assignment");
        items.erase(items.begin() + i);
      } else {
        throw TypeError("'" + TypeName(object) +
                        "' object does not support item deletion");
      }
      return;
    }
    case ast::ExprKind::kList:
    case ast::ExprKind::kTuple:
      for (const ast::ExprPtr& elt :
           static_cast<const ast::Sequence&>(target).elts)
        ExecDelete(*elt);
      return;
    case ast::ExprKind::kAttribute: {
      const auto& attr = static_cast<const ast::Attribute&>(target);
      SetAttr(Eval(*attr.value), attr.attr);
    }
    default:
      throw ScriptError("SyntaxError", "cannot delete expression");
  }
}

void Interpreter::AssignName(const std::string& name, Value value) {
  if (scope_ != globals_ && scope_->global_names.count(name)) {
    globals_->vars[name] = std::move(value);
  } else {
    scope_->vars[name] = std::move(value);
  }
}

void Interpreter::Assign(const ast::Expr& target, Value value) {
  switch (target.kind) {
    case ast::ExprKind::kName:
      AssignName(static_cast<const ast::Name&>(target).id, std::move(value));
      return;
    case ast::ExprKind::kAttribute: {
      const auto& attr = static_cast<const ast::Attribute&>(target);
      SetAttr(Eval(*attr.value), attr.attr);
    }
    case ast::ExprKind::kSubscript: {
      const auto& sub = static_cast<const ast::Subscript&>(target);
      Value object = Eval(*sub.value);
      if (sub.index->kind != ast::ExprKind::kSlice) {
        SetItem(object, Eval(*sub.index), std::move(value));
        return;
      }
      if (!object.is_list())
        throw TypeError("'" + TypeName(object) +
                        "' object does not support slice assignment");
      const auto& slice = static_cast<const ast::Slice&>(*sub.index);
      Value lower = slice.lower ? Eval(*slice.lower) : Value::None();
      Value upper = slice.upper ? Eval(*slice.upper) : Value::None();
      Value step = slice.step ? Eval(*slice.step) : Value::None();
      std::vector<Value> replacement = ToVector(value);
      std::vector<Value>& items = object.items();
      int64_t start, stop, stride;
      AdjustSlice(lower, upper, step, items.size(), &start, &stop, &stride);
      if (stride == 1) {
        if (stop < start) stop = start;
        items.erase(items.begin() + start, items.begin() + stop);
        items.insert(items.begin() + start, replacement.begin(),
                     replacement.end());
        return;
      }
      std::vector<int64_t> indices =
          SliceIndices(lower, upper, step, items.size());
      if (indices.size() != replacement.size()) {
        throw ScriptError(
            "ValueError",
            absl::StrCat("attempt to assign sequence of size ",
                         replacement.size(), " to extended slice of size ",
                         indices.size()));
      }
      for (size_t i = 0; i < indices.size(); i++)
        items[indices[i]] = replacement[i];
      return;
    }
    case ast::ExprKind::kList:
    case ast::ExprKind::kTuple: {
      const auto& elts = static_cast<const ast::Sequence&>(target).elts;
      std::vector<Value> values = ToVector(value);
      size_t starred = elts.size();
      for (size_t i = 0; i < elts.size(); i++) {
        if (elts[i]->kind == ast::ExprKind::kStarred) {
          if (starred != elts.size())
            throw ScriptError("SyntaxError",
                              "multiple starred expressions in assignment");
          starred = i;
        }
      }
      if (starred == elts.size()) {
        if (values.size() < elts.size()) {
          throw ScriptError(
              "ValueError",
              absl::StrCat("not enough values to unpack (expected ",
                           elts.size(), ", got ", values.size(), ")"));
        }
        if (values.size() > elts.size()) {
          throw ScriptError("ValueError",
                            absl::StrCat("too many values to unpack (expected ",
                                         elts.size(), ")"));
        }
        for (size_t i = 0; i < elts.size(); i++) Assign(*elts[i], values[i]);
        return;
      }
      size_t after = elts.size() - starred - 1;
      if (values.size() < elts.size() - 1) {
        throw ScriptError(
            "ValueError",
            absl::StrCat("not enough values to unpack (expected at least ",
                         elts.size() - 1, ", got ", values.size(), ")"));
      }
      for (size_t i = 0; i < starred; i++) Assign(*elts[i], values[i]);
      std::vector<Value> middle(values.begin() + starred,
                                values.end() - after);
      Assign(*static_cast<const ast::Starred&>(*elts[starred]).value,
             Value::List(std::move(middle)));
      for (size_t i = 0; i < after; i++) {
        Assign(*elts[starred + 1 + i], values[values.size() - after + i]);
      }
      return;
    }
    default:
      throw ScriptError("SyntaxError", "cannot assign to expression");
  }
}

void Interpreter::SetItem(const Value& object, const Value& index,
                          Value value) {
  if (object.is_dict()) {
    object.dict().Set(index, std::move(value));
  } else if (object.is_list()) {
    std::vector<Value>& items = object.items();
    int64_t i = NormalizeIndex(
        ToIndex(index, "list indices must be integers or slices"),
        items.size(), "list assignment");
    items[i] = std::move(value);
  } else {
    throw TypeError("'" + TypeName(object) +
                    "' object does not support item assignment");
  }
}

void Interpreter::SetAttr(const Value& object, const std::string& name) {
  throw ScriptError("AttributeError", "'" + TypeName(object) +
                                          "' object attribute '" + name +
                                          "' is read-only");
}

Value Interpreter::Eval(const ast::Expr& expr) {
  switch (expr.kind) {
    case ast::ExprKind::kConstant:
      return static_cast<const ast::Constant&>(expr).value;
    case ast::ExprKind::kName:
      return EvalName(static_cast<const ast::Name&>(expr));
    case ast::ExprKind::kAttribute: {
      const auto& node = static_cast<const ast::Attribute&>(expr);
      return GetAttr(Eval(*node.value), node.attr);
    }
    case ast::ExprKind::kSubscript:
      return EvalSubscript(static_cast<const ast::Subscript&>(expr));
    case ast::ExprKind::kCall:
      return EvalCall(static_cast<const ast::Call&>(expr));
    case ast::ExprKind::kBinary: {
      const auto& node = static_cast<const ast::Binary&>(expr);
      Value left = Eval(*node.left);
      return BinaryOp(node.op, left, Eval(*node.right));
    }
    case ast::ExprKind::kUnary:
      return EvalUnary(static_cast<const ast::Unary&>(expr));
    case ast::ExprKind::kBoolOp: {
      const auto& node = static_cast<const ast::BoolOp&>(expr);
      Value value;
      for (const ast::ExprPtr& operand : node.values) {
        value = Eval(*operand);
        if (Truthy(value) != node.is_and) return value;
      }
      return value;
    }
    case ast::ExprKind::kCompare:
      return EvalCompare(static_cast<const ast::Compare&>(expr));
    case ast::ExprKind::kIfExp: {
      const auto& node = static_cast<const ast::IfExp&>(expr);
      return Truthy(Eval(*node.test)) ? Eval(*node.body) : Eval(*node.orelse);
    }
    case ast::ExprKind::kList:
      return Value::List(
          EvalElements(static_cast<const ast::Sequence&>(expr).elts));
    case ast::ExprKind::kTuple:
      return Value::Tuple(
          EvalElements(static_cast<const ast::Sequence&>(expr).elts));
    case ast::ExprKind::kDict: {
      const auto& node = static_cast<const ast::DictDisplay&>(expr);
      Value dict = Value::NewDict();
      for (size_t i = 0; i < node.keys.size(); i++) {
        Value key = Eval(*node.keys[i]);
        dict.dict().Set(key, Eval(*node.values[i]));
      }
      return dict;
    }
    case ast::ExprKind::kListComp:
    case ast::ExprKind::kDictComp:
      return EvalComprehension(static_cast<const ast::Comp&>(expr));
    case ast::ExprKind::kLambda: {
      const auto& node = static_cast<const ast::Lambda&>(expr);
      Value function = MakeFunction("<lambda>", node.signature);
      function.object<UserFunction>()->expression = node.body.get();
      return function;
    }
    case ast::ExprKind::kFString:
      return EvalFString(static_cast<const ast::FString&>(expr));
    case ast::ExprKind::kSlice:
    case ast::ExprKind::kStarred:
      break;
  }
  throw ScriptError("SyntaxError", "can't use starred expression here");
}

Value Interpreter::EvalName(const ast::Name& node) {
  for (Scope* scope = scope_.get(); scope; scope = scope->parent.get()) {
    if (scope->global_names.count(node.id)) {
      scope = globals_.get();
      auto it = scope->vars.find(node.id);
      if (it != scope->vars.end()) return it->second;
      break;
    }
    auto it = scope->vars.find(node.id);
    if (it != scope->vars.end()) return it->second;
  }
  auto it = builtins_.find(node.id);
  if (it != builtins_.end()) return it->second;
  throw ScriptError("NameError", "name '" + node.id + "' is not defined");
}

std::vector<Value> Interpreter::EvalElements(
    const std::vector<ast::ExprPtr>& elts) {
  std::vector<Value> values;
  values.reserve(elts.size());
  for (const ast::ExprPtr& elt : elts) {
    if (elt->kind == ast::ExprKind::kStarred) {
      std::vector<Value> expanded =
          ToVector(Eval(*static_cast<const ast::Starred&>(*elt).value));
      values.insert(values.end(), expanded.begin(), expanded.end());
    } else {
      values.push_back(Eval(*elt));
    }
  }
  return values;
}

Value Interpreter::EvalCall(const ast::Call& node) {
  Value callee = Eval(*node.func);
  CallArgs args;
  args.args = EvalElements(node.args);
  for (const ast::Keyword& keyword : node.keywords)
    args.kwargs.emplace_back(keyword.name, Eval(*keyword.value));
  return Call(callee, std::move(args));
}

Value Interpreter::Call(const Value& callee, CallArgs args) {
  CheckInterrupt();
  switch (callee.type()) {
    case Type::kNative:
      return callee.object<NativeObject>()->fn(this, &args);
    case Type::kFunction:
      return CallFunction(*callee.object<UserFunction>(), std::move(args));
    case Type::kClass: {
      const std::string& name = callee.object<ClassObject>()->name;
      if (!args.kwargs.empty())
        throw TypeError(name + "() takes no keyword arguments");
      return Value::FromObject(
          Type::kException,
          std::make_shared<ExceptionObject>(classes_[name],
                                            std::move(args.args)));
    }
    default:
      throw TypeError("'" + TypeName(callee) + "' object is not callable");
  }
}

Value Interpreter::CallFunction(const UserFunction& function, CallArgs args) {
  if (call_depth_ >= max_recursion_depth_)
    throw ScriptError("RecursionError", "maximum recursion depth exceeded");
  auto scope = std::make_shared<Scope>(function.closure);
  BindArguments(function, std::move(args), scope.get());
  int line = function.expression ? function.expression->line
                                 : frames_.back().line;
  FrameGuard guard(this, function.name, line, scope);
  try {
    if (function.expression) return Eval(*function.expression);
    Flow flow = ExecBlock(*function.body);
    if (flow != Flow::kReturn) return Value::None();
    Value result = std::move(return_value_);
    return_value_ = Value();
    return result;
  } catch (ScriptError& e) {
    e.AddFrame(function.name, frames_.back().line);
    throw;
  }
}

void Interpreter::BindArguments(const UserFunction& function, CallArgs args,
                                Scope* scope) {
  const ast::Signature& signature = *function.signature;
  const std::vector<ast::Param>& params = signature.params;
  std::vector<bool> bound(params.size(), false);
  size_t positional = std::min(args.args.size(), params.size());
  for (size_t i = 0; i < positional; i++) {
    scope->vars[params[i].name] = std::move(args.args[i]);
    bound[i] = true;
  }
  if (args.args.size() > params.size()) {
    if (signature.vararg.empty()) {
      throw TypeError(absl::StrCat(function.name, "() takes ", params.size(),
                                   " positional argument",
                                   params.size() == 1 ? "" : "s", " but ",
                                   args.args.size(), " were given"));
    }
    scope->vars[signature.vararg] = Value::Tuple(std::vector<Value>(
        args.args.begin() + params.size(), args.args.end()));
  } else if (!signature.vararg.empty()) {
    scope->vars[signature.vararg] = Value::Tuple();
  }
  Value kwarg_dict = Value::NewDict();
  for (auto& kwarg : args.kwargs) {
    size_t i = 0;
    while (i < params.size() && params[i].name != kwarg.first) i++;
    if (i < params.size()) {
      if (bound[i])
        throw TypeError(function.name + "() got multiple values for argument '" +
                        kwarg.first + "'");
      scope->vars[kwarg.first] = std::move(kwarg.second);
      bound[i] = true;
    } else if (!signature.kwarg.empty()) {
      kwarg_dict.dict().Set(Value::Str(kwarg.first), std::move(kwarg.second));
    } else {
      throw TypeError(function.name + "() got an unexpected keyword argument '" +
                      kwarg.first + "'");
    }
  }
  if (!signature.kwarg.empty()) scope->vars[signature.kwarg] = kwarg_dict;
  for (size_t i = 0; i < params.size(); i++) {
    if (bound[i]) continue;
    if (!params[i].default_value)
      throw TypeError(function.name + "() missing required argument: '" +
                      params[i].name + "'");
    scope->vars[params[i].name] = function.defaults[i];
  }
}

Value Interpreter::EvalSubscript(const ast::Subscript& node) {
  Value object = Eval(*node.value);
  if (node.index->kind != ast::ExprKind::kSlice)
    return GetItem(object, Eval(*node.index));
  const auto& slice = static_cast<const ast::Slice&>(*node.index);
  Value lower = slice.lower ? Eval(*slice.lower) : Value::None();
  Value upper = slice.upper ? Eval(*slice.upper) : Value::None();
  Value step = slice.step ? Eval(*slice.step) : Value::None();
  switch (object.type()) {
    case Type::kList:
    case Type::kTuple: {
      const std::vector<Value>& items = object.items();
      std::vector<Value> out;
      for (int64_t i : SliceIndices(lower, upper, step, items.size()))
        out.push_back(items[i]);
      return object.is_list() ? Value::List(std::move(out))
                              : Value::Tuple(std::move(out));
    }
    case Type::kStr: {
      const std::string& s = object.str();
      std::string out;
      if (CodePointCount(s) == static_cast<int64_t>(s.size())) {
        for (int64_t i : SliceIndices(lower, upper, step, s.size())) out += s[i];
      } else {
        std::vector<std::string> points = CodePoints(s);
        for (int64_t i : SliceIndices(lower, upper, step, points.size()))
          out += points[i];
      }
      return Value::Str(std::move(out));
    }
    case Type::kRange: {
      const RangeObject& range = object.range();
      std::vector<Value> out;
      for (int64_t i : SliceIndices(lower, upper, step, range.Size()))
        out.push_back(Value::Int(range.At(i)));
      return Value::List(std::move(out));
    }
    default:
      throw TypeError("'" + TypeName(object) + "' object is not subscriptable");
  }
}

Value Interpreter::GetItem(const Value& object, const Value& index) {
  switch (object.type()) {
    case Type::kList:
    case Type::kTuple: {
      const char* name = object.is_list() ? "list" : "tuple";
      const std::vector<Value>& items = object.items();
      int64_t i = ToIndex(index, absl::StrCat(name, " indices must be integers or slices").c_str());
      return items[NormalizeIndex(i, items.size(), name)];
    }
    case Type::kStr: {
      const std::string& s = object.str();
      int64_t i = ToIndex(index, "string indices must be integers");
      if (CodePointCount(s) == static_cast<int64_t>(s.size()))
        return Value::Str(std::string(1, s[NormalizeIndex(i, s.size(), "string")]));
      std::vector<std::string> points = CodePoints(s);
      return Value::Str(points[NormalizeIndex(i, points.size(), "string")]);
    }
    case Type::kDict: {
      Value* value = object.dict().Find(index);
      if (!value) throw ScriptError("KeyError", Repr(index));
      return *value;
    }
    case Type::kRange: {
      const RangeObject& range = object.range();
      int64_t i = ToIndex(index, "range indices must be integers or slices");
      return Value::Int(range.At(NormalizeIndex(i, range.Size(), "range object")));
    }
    default:
      throw TypeError("'" + TypeName(object) + "' object is not subscriptable");
  }
}

Value Interpreter::GetAttr(const Value& object, const std::string& name) {
  if (IsDunder(name))
    throw ScriptError("AttributeError",
                      "access to '" + name + "' is not allowed");
  if (object.type() == Type::kModule) {
    const auto* module = object.object<ModuleObject>();
    auto it = module->attributes.find(name);
    if (it == module->attributes.end())
      throw ScriptError("AttributeError", "module '" + module->name +
                                              "' has no attribute '" + name +
                                              "'");
    return it->second;
  }
  if (object.type() == Type::kException && name == "args")
    return Value::Tuple(object.object<ExceptionObject>()->args);
  Value method;
  if (LookupMethod(object, name, &method)) return method;
  throw ScriptError("AttributeError", "'" + TypeName(object) +
                                          "' object has no attribute '" +
                                          name + "'");
}

Value Interpreter::EvalUnary(const ast::Unary& node) {
  Value operand = Eval(*node.operand);
  switch (node.op) {
    case ast::UnaryOp::kNot:
      return Value::Bool(!Truthy(operand));
    case ast::UnaryOp::kNeg:
      if (operand.is_float()) return Value::Float(-operand.float_value());
      if (operand.is_bool() || operand.is_int()) {
        if (operand.int_value() == INT64_MIN) throw Overflow();
        return Value::Int(-operand.int_value());
      }
      throw TypeError("bad operand type for unary -: '" + TypeName(operand) +
                      "'");
    case ast::UnaryOp::kPos:
      if (operand.is_float()) return operand;
      if (operand.is_bool() || operand.is_int())
        return Value::Int(operand.int_value());
      throw TypeError("bad operand type for unary +: '" + TypeName(operand) +
                      "'");
    case ast::UnaryOp::kInvert:
      if (operand.is_bool() || operand.is_int())
        return Value::Int(~operand.int_value());
      throw TypeError("bad operand type for unary ~: '" + TypeName(operand) +
                      "'");
  }
  return Value();
}

Value Interpreter::EvalCompare(const ast::Compare& node) {
  Value left = Eval(*node.left);
  for (size_t i = 0; i < node.ops.size(); i++) {
    Value right = Eval(*node.comparators[i]);
    if (!CompareOp(node.ops[i], left, right)) return Value::Bool(false);
    left = std::move(right);
  }
  return Value::Bool(true);
}

bool Interpreter::CompareOp(ast::CmpOp op, const Value& a, const Value& b) {
  switch (op) {
    case ast::CmpOp::kEq:
      return Equals(a, b);
    case ast::CmpOp::kNe:
      return !Equals(a, b);
    case ast::CmpOp::kLt:
      return Less(a, b);
    case ast::CmpOp::kGt:
      return Less(b, a);
    case ast::CmpOp::kLe:
      if (a.is_number() && b.is_number()) return !Less(b, a) && Equals(a, a) && Equals(b, b);
      return Less(a, b) || Equals(a, b);
    case ast::CmpOp::kGe:
      if (a.is_number() && b.is_number()) return !Less(a, b) && Equals(a, a) && Equals(b, b);
      return Less(b, a) || Equals(a, b);
    case ast::CmpOp::kIn:
      return Contains(b, a);
    case ast::CmpOp::kNotIn:
      return !Contains(b, a);
    case ast::CmpOp::kIs:
      return Same(a, b);
    case ast::CmpOp::kIsNot:
      return !Same(a, b);
  }
  return false;
}

bool Interpreter::Less(const Value& a, const Value& b) {
  if (a.is_number() && b.is_number()) {
    if (a.is_float() || b.is_float()) return a.AsDouble() < b.AsDouble();
    return a.int_value() < b.int_value();
  }
  if (a.is_str() && b.is_str()) return a.str() < b.str();
  if ((a.is_list() && b.is_list()) || (a.is_tuple() && b.is_tuple())) {
    const std::vector<Value>& x = a.items();
    const std::vector<Value>& y = b.items();
    for (size_t i = 0; i < x.size() && i < y.size(); i++) {
      if (!Equals(x[i], y[i])) return Less(x[i], y[i]);
    }
    return x.size() < y.size();
  }
  throw TypeError("'<' not supported between instances of '" + TypeName(a) +
                  "' and '" + TypeName(b) + "'");
}

bool Interpreter::Contains(const Value& container, const Value& item) {
  switch (container.type()) {
    case Type::kStr:
      if (!item.is_str())
        throw TypeError("'in <string>' requires string as left operand, not " +
                        TypeName(item));
      return container.str().find(item.str()) != std::string::npos;
    case Type::kList:
    case Type::kTuple:
      for (const Value& element : container.items()) {
        if (Same(element, item) || Equals(element, item)) return true;
      }
      return false;
    case Type::kDict:
      return container.dict().Find(item) != nullptr;
    case Type::kRange: {
      if (!item.is_int() && !item.is_bool()) {
        if (!item.is_float()) return false;
        double f = item.float_value();
        if (f != std::floor(f)) return false;
      }
      const RangeObject& range = container.range();
      int64_t v = item.is_float() ? static_cast<int64_t>(item.float_value())
                                  : item.int_value();
      if (range.step > 0 ? (v < range.start || v >= range.stop)
                         : (v > range.start || v <= range.stop))
        return false;
      return (v - range.start) % range.step == 0;
    }
    default:
      throw TypeError("argument of type '" + TypeName(container) +
                      "' is not iterable");
  }
}

Value Interpreter::BinaryOp(ast::BinOp op, const Value& a, const Value& b) {
  if (a.is_number() && b.is_number()) {
    if (a.is_float() || b.is_float()) {
      if (op == ast::BinOp::kBitAnd || op == ast::BinOp::kBitOr ||
          op == ast::BinOp::kBitXor || op == ast::BinOp::kLShift ||
          op == ast::BinOp::kRShift)
        throw Unsupported(op, a, b);
      return FloatOp(op, a.AsDouble(), b.AsDouble());
    }
    if (a.is_bool() && b.is_bool() &&
        (op == ast::BinOp::kBitAnd || op == ast::BinOp::kBitOr ||
         op == ast::BinOp::kBitXor))
      return Value::Bool(IntOp(op, a.int_value(), b.int_value()).int_value());
    return IntOp(op, a.int_value(), b.int_value());
  }
  switch (op) {
    case ast::BinOp::kAdd:
      if (a.is_str() && b.is_str()) return Value::Str(a.str() + b.str());
      if ((a.is_list() && b.is_list()) || (a.is_tuple() && b.is_tuple())) {
        std::vector<Value> items = a.items();
        items.insert(items.end(), b.items().begin(), b.items().end());
        return a.is_list() ? Value::List(std::move(items))
                           : Value::Tuple(std::move(items));
      }
      break;
    case ast::BinOp::kMul: {
      const Value* seq = &a;
      const Value* count = &b;
      if (a.is_int() || a.is_bool()) std::swap(seq, count);
      if (!count->is_int() && !count->is_bool()) break;
      int64_t n = count->int_value();
      if (seq->is_str()) return Value::Str(Repeat(seq->str(), n));
      if (seq->is_list()) return Value::List(Repeat(seq->items(), n));
      if (seq->is_tuple()) return Value::Tuple(Repeat(seq->items(), n));
      break;
    }
    case ast::BinOp::kMod:
      if (a.is_str()) return Value::Str(PercentFormat(a.str(), b));
      break;
    default:
      break;
  }
  throw Unsupported(op, a, b);
}

Value Interpreter::EvalComprehension(const ast::Comp& node) {
  bool is_list = node.kind == ast::ExprKind::kListComp;
  Value result = is_list ? Value::List() : Value::NewDict();
  // The outermost iterable is evaluated in the enclosing scope.
  Value first = Eval(*node.generators[0].iter);
  ScopeGuard guard(this, std::make_shared<Scope>(scope_));
  std::function<void(size_t)> run = [&](size_t level) {
    if (level == node.generators.size()) {
      if (is_list) {
        result.items().push_back(Eval(*node.elt));
      } else {
        Value key = Eval(*node.elt);
        result.dict().Set(key, Eval(*node.value));
      }
      return;
    }
    const ast::Comprehension& generator = node.generators[level];
    Value iterable = level == 0 ? first : Eval(*generator.iter);
    ForEach(iterable, [&](const Value& item) {
      Assign(*generator.target, item);
      for (const ast::ExprPtr& condition : generator.conditions) {
        if (!Truthy(Eval(*condition))) return true;
      }
      run(level + 1);
      return true;
    });
  };
  run(0);
  return result;
}

Value Interpreter::EvalFString(const ast::FString& node) {
  std::string out;
  for (const ast::FString::Part& part : node.parts) {
    if (!part.value) {
      out += part.literal;
      continue;
    }
    out += part.literal;
    Value value = Eval(*part.value);
    if (part.conversion == 'r') {
      value = Value::Str(Repr(value));
    } else if (part.conversion == 's') {
      value = Value::Str(Str(value));
    }
    out += FormatValue(value, part.spec);
  }
  return Value::Str(std::move(out));
}

void Interpreter::ForEach(const Value& iterable,
                          const std::function<bool(const Value&)>& fn) {
  switch (iterable.type()) {
    case Type::kList:
    case Type::kTuple: {
      // Indexing each time so that appends during the loop are visited.
      const std::vector<Value>& items = iterable.items();
      for (size_t i = 0; i < items.size(); i++) {
        CheckInterrupt();
        Value item = items[i];
        if (!fn(item)) return;
      }
      return;
    }
    case Type::kStr: {
      const std::string& s = iterable.str();
      if (CodePointCount(s) == static_cast<int64_t>(s.size())) {
        std::string copy = s;
        for (char c : copy) {
          CheckInterrupt();
          if (!fn(Value::Str(std::string(1, c)))) return;
        }
        return;
      }
      for (const std::string& point : CodePoints(s)) {
        CheckInterrupt();
        if (!fn(Value::Str(point))) return;
      }
      return;
    }
    case Type::kDict: {
      Dict& dict = iterable.dict();
      std::vector<Value> keys;
      for (const auto& entry : dict.entries()) keys.push_back(entry.first);
      size_t size = dict.size();
      for (const Value& key : keys) {
        CheckInterrupt();
        if (!fn(key)) return;
        if (dict.size() != size)
          throw ScriptError("RuntimeError",
                            "dictionary changed size during iteration");
      }
      return;
    }
    case Type::kRange: {
      const RangeObject& range = iterable.range();
      int64_t size = range.Size();
      for (int64_t i = 0; i < size; i++) {
        CheckInterrupt();
        if (!fn(Value::Int(range.At(i)))) return;
      }
      return;
    }
    default:
      throw TypeError("'" + TypeName(iterable) + "' object is not iterable");
  }
}

std::vector<Value> Interpreter::ToVector(const Value& iterable) {
  if (iterable.is_list() || iterable.is_tuple()) return iterable.items();
  std::vector<Value> out;
  ForEach(iterable, [&out](const Value& item) {
    out.push_back(item);
    return true;
  });
  return out;
}

bool Interpreter::IsInstance(const Value& value, const Value& cls) {
  switch (cls.type()) {
    case Type::kTuple:
      for (const Value& item : cls.items()) {
        if (IsInstance(value, item)) return true;
      }
      return false;
    case Type::kClass:
      return value.type() == Type::kException &&
             value.object<ExceptionObject>()->cls->IsSubclassOf(
                 cls.object<ClassObject>());
    case Type::kNative: {
      const auto* native = cls.object<NativeObject>();
      if (native->is_type) {
        if (native->name == "object") return true;
        if (native->name == "int" && value.is_bool()) return true;
        return TypeName(value) == native->name;
      }
      break;
    }
    default:
      break;
  }
  throw TypeError("isinstance() arg 2 must be a type or tuple of types");
}

}  // namespace script
