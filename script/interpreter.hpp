#ifndef SCRIPT_INTERPRETER_HPP
#define SCRIPT_INTERPRETER_HPP

#include <signal.h>
#include <stdint.h>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "script/ast.hpp"
#include "script/errors.hpp"
#include "script/value.hpp"

namespace script {

// Arguments of a call, after unpacking of starred arguments.
struct CallArgs {
  std::vector<Value> args;
  std::vector<std::pair<std::string, Value>> kwargs;

  // Returns the argument at the given position or with the given keyword,
  // or nullptr if absent. name may be nullptr for positional-only
  // parameters.
  const Value* Get(size_t position, const char* name) const;

  // Throws TypeError unless min <= args.size() <= max and every keyword is
  // one of the accepted names.
  void Check(const char* function, size_t min, size_t max,
             const std::set<std::string>& keywords = {}) const;
};

// Variables of a module, function call or comprehension.
struct Scope {
  explicit Scope(std::shared_ptr<Scope> parent) : parent(std::move(parent)) {}
  std::unordered_map<std::string, Value> vars;
  // Enclosing scope for name lookup; null for the module scope.
  std::shared_ptr<Scope> parent;
  // Names declared global in a function body.
  std::set<std::string> global_names;
};

// A def or lambda. Holds the program alive since it points into its tree.
struct UserFunction : public FunctionObject {
  UserFunction(std::string name, std::shared_ptr<const ast::Module> program)
      : FunctionObject(std::move(name)), program(std::move(program)) {}
  std::shared_ptr<const ast::Module> program;
  const ast::Signature* signature = nullptr;
  // Exactly one of body and expression is set.
  const ast::Body* body = nullptr;
  const ast::Expr* expression = nullptr;
  std::vector<Value> defaults;
  std::shared_ptr<Scope> closure;
};

// A tree-walking interpreter for the supported Python subset. The builtins
// and importable modules are installed by the embedder; without them the
// program can only compute on literals.
class Interpreter {
 public:
  using ModuleFactory = std::function<Value(Interpreter*)>;

  struct Frame {
    std::string function;
    int line;
    std::shared_ptr<Scope> scope;
  };

  explicit Interpreter(int max_recursion_depth = 100);
  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;

  void SetBuiltin(const std::string& name, Value value);
  void RemoveBuiltin(const std::string& name);
  bool HasBuiltin(const std::string& name) const {
    return builtins_.count(name) != 0;
  }
  // Makes "import name" call factory the first time it is executed.
  void RegisterModule(const std::string& name, ModuleFactory factory);

  void SetGlobal(const std::string& name, Value value);
  bool GetGlobal(const std::string& name, Value* value) const;
  const std::unordered_map<std::string, Value>& globals() const {
    return globals_->vars;
  }

  // Runs a whole program in the module scope. Throws ScriptError for
  // uncaught script exceptions, Interrupted if RequestInterrupt was called,
  // and std::bad_alloc when memory runs out.
  void Run(std::shared_ptr<const ast::Module> program);

  // Calls any callable value.
  Value Call(const Value& callee, CallArgs args);

  // The exception class with the given name, registering it as a subclass
  // of base if it does not exist yet.
  Value ExceptionClass(const std::string& name,
                       const std::string& base = "Exception");
  std::vector<std::string> ExceptionClassNames() const;

  // isinstance() semantics; cls may be a tuple of classes.
  bool IsInstance(const Value& value, const Value& cls);

  // Python's "<", throwing TypeError for unordered types.
  bool Less(const Value& a, const Value& b);
  Value BinaryOp(ast::BinOp op, const Value& a, const Value& b);
  bool Contains(const Value& container, const Value& item);
  Value GetAttr(const Value& object, const std::string& name);
  Value GetItem(const Value& object, const Value& index);

  // Calls fn for every element of an iterable until it returns false.
  void ForEach(const Value& iterable, const std::function<bool(const Value&)>& fn);
  std::vector<Value> ToVector(const Value& iterable);

  // The innermost frame being executed.
  const Frame& CurrentFrame() const { return frames_.back(); }

  // Checks the interrupt flag; long-running natives call it.
  void CheckInterrupt() const {
    if (interrupt_requested_) throw Interrupted();
  }

  // Async-signal-safe.
  static void RequestInterrupt() { interrupt_requested_ = 1; }
  static void ClearInterrupt() { interrupt_requested_ = 0; }

 private:
  enum class Flow { kNormal, kBreak, kContinue, kReturn };
  class FrameGuard;
  class ScopeGuard;

  Flow ExecBlock(const ast::Body& body);
  Flow Exec(const ast::Stmt& stmt);
  Flow ExecFor(const ast::For& node);
  Flow ExecWhile(const ast::While& node);
  Flow ExecTry(const ast::Try& node);
  Flow ExecTryHandlers(const ast::Try& node);
  void ExecImport(const ast::Import& node);
  void ExecImportFrom(const ast::ImportFrom& node);
  void ExecRaise(const ast::Raise& node);
  void ExecDelete(const ast::Expr& target);
  void DefineFunction(const ast::FunctionDef& node);

  Value Eval(const ast::Expr& expr);
  Value EvalName(const ast::Name& node);
  Value EvalCall(const ast::Call& node);
  Value EvalSubscript(const ast::Subscript& node);
  Value EvalUnary(const ast::Unary& node);
  Value EvalCompare(const ast::Compare& node);
  Value EvalComprehension(const ast::Comp& node);
  Value EvalFString(const ast::FString& node);
  Value MakeFunction(std::string name, const ast::Signature& signature);
  std::vector<Value> EvalElements(const std::vector<ast::ExprPtr>& elts);
  bool CompareOp(ast::CmpOp op, const Value& a, const Value& b);

  void Assign(const ast::Expr& target, Value value);
  void AssignName(const std::string& name, Value value);
  void SetItem(const Value& object, const Value& index, Value value);
  [[noreturn]] void SetAttr(const Value& object, const std::string& name);

  Value CallFunction(const UserFunction& function, CallArgs args);
  void BindArguments(const UserFunction& function, CallArgs args,
                     Scope* scope);
  Value ImportModule(const std::string& name);

  // Builds the exception object of a caught error.
  Value Materialize(const ScriptError& error);
  bool Matches(const ScriptError& error, const Value& cls);

  std::shared_ptr<const ast::Module> program_;
  std::shared_ptr<Scope> globals_;
  std::shared_ptr<Scope> scope_;
  std::unordered_map<std::string, Value> builtins_;
  std::map<std::string, ModuleFactory> module_factories_;
  std::map<std::string, Value> modules_;
  std::map<std::string, std::shared_ptr<ClassObject>> classes_;
  std::vector<Frame> frames_;
  // Exceptions being handled, for bare "raise".
  std::vector<ScriptError> handling_;
  Value return_value_;
  int max_recursion_depth_;
  int call_depth_ = 0;

  static volatile sig_atomic_t interrupt_requested_;
};

// Methods of builtin types, looked up by GetAttr. Returns false if the type
// has no method with that name.
bool LookupMethod(const Value& self, const std::string& name, Value* method);

// Stable sort by key (or by the items themselves if key is None), as
// list.sort does.
void SortValues(Interpreter* interpreter, std::vector<Value>* items,
                const Value& key, bool reverse);

// Index arithmetic shared by subscripts and slices.
int64_t NormalizeIndex(int64_t index, int64_t size, const char* type_name);
// Resolves a slice against a sequence length the way Python does. None
// values select the defaults.
void AdjustSlice(const Value& lower, const Value& upper, const Value& step,
                 int64_t size, int64_t* start, int64_t* stop, int64_t* stride);
std::vector<int64_t> SliceIndices(const Value& lower, const Value& upper,
                                  const Value& step, int64_t size);

// Unicode helpers: strings are stored as UTF-8 and indexed by code point.
std::vector<std::string> CodePoints(const std::string& s);
int64_t CodePointCount(const std::string& s);

// Integer conversion of an index-like value (int or bool).
int64_t ToIndex(const Value& value, const char* what);

}  // namespace script

#endif
