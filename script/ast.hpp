#ifndef SCRIPT_AST_HPP
#define SCRIPT_AST_HPP

#include <memory>
#include <string>
#include <vector>

#include "script/value.hpp"

namespace script {
namespace ast {

struct Node {
  int line = 0;
  int column = 0;
};

enum class ExprKind {
  kConstant,
  kName,
  kAttribute,
  kSubscript,
  kSlice,
  kCall,
  kBinary,
  kUnary,
  kBoolOp,
  kCompare,
  kIfExp,
  kList,
  kTuple,
  kDict,
  kListComp,
  kDictComp,
  kLambda,
  kFString,
  kStarred
};

struct Expr : public Node {
  explicit Expr(ExprKind kind) : kind(kind) {}
  virtual ~Expr() = default;
  const ExprKind kind;
};

using ExprPtr = std::unique_ptr<Expr>;

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;
using Body = std::vector<StmtPtr>;

struct Constant : public Expr {
  explicit Constant(Value value)
      : Expr(ExprKind::kConstant), value(std::move(value)) {}
  Value value;
};

struct Name : public Expr {
  explicit Name(std::string id) : Expr(ExprKind::kName), id(std::move(id)) {}
  std::string id;
};

struct Attribute : public Expr {
  Attribute() : Expr(ExprKind::kAttribute) {}
  ExprPtr value;
  std::string attr;
};

struct Subscript : public Expr {
  Subscript() : Expr(ExprKind::kSubscript) {}
  ExprPtr value;
  ExprPtr index;
};

// lower:upper:step inside a subscript. Missing parts are null.
struct Slice : public Expr {
  Slice() : Expr(ExprKind::kSlice) {}
  ExprPtr lower;
  ExprPtr upper;
  ExprPtr step;
};

struct Keyword {
  std::string name;
  ExprPtr value;
};

struct Call : public Expr {
  Call() : Expr(ExprKind::kCall) {}
  ExprPtr func;
  std::vector<ExprPtr> args;
  std::vector<Keyword> keywords;
};

enum class BinOp {
  kAdd,
  kSub,
  kMul,
  kDiv,
  kFloorDiv,
  kMod,
  kPow,
  kBitAnd,
  kBitOr,
  kBitXor,
  kLShift,
  kRShift
};

struct Binary : public Expr {
  Binary() : Expr(ExprKind::kBinary) {}
  BinOp op = BinOp::kAdd;
  ExprPtr left;
  ExprPtr right;
};

enum class UnaryOp { kNeg, kPos, kNot, kInvert };

struct Unary : public Expr {
  Unary() : Expr(ExprKind::kUnary) {}
  UnaryOp op = UnaryOp::kNeg;
  ExprPtr operand;
};

struct BoolOp : public Expr {
  BoolOp() : Expr(ExprKind::kBoolOp) {}
  bool is_and = true;
  std::vector<ExprPtr> values;
};

enum class CmpOp { kEq, kNe, kLt, kLe, kGt, kGe, kIn, kNotIn, kIs, kIsNot };

struct Compare : public Expr {
  Compare() : Expr(ExprKind::kCompare) {}
  ExprPtr left;
  std::vector<CmpOp> ops;
  std::vector<ExprPtr> comparators;
};

struct IfExp : public Expr {
  IfExp() : Expr(ExprKind::kIfExp) {}
  ExprPtr test;
  ExprPtr body;
  ExprPtr orelse;
};

// List and tuple displays.
struct Sequence : public Expr {
  explicit Sequence(ExprKind kind) : Expr(kind) {}
  std::vector<ExprPtr> elts;
};

struct DictDisplay : public Expr {
  DictDisplay() : Expr(ExprKind::kDict) {}
  std::vector<ExprPtr> keys;
  std::vector<ExprPtr> values;
};

struct Comprehension {
  ExprPtr target;
  ExprPtr iter;
  std::vector<ExprPtr> conditions;
};

// List comprehensions and generator expressions (evaluated eagerly), and
// dict comprehensions, where elt is the key.
struct Comp : public Expr {
  explicit Comp(ExprKind kind) : Expr(kind) {}
  ExprPtr elt;
  ExprPtr value;
  std::vector<Comprehension> generators;
};

struct Param {
  std::string name;
  ExprPtr default_value;
};

struct Signature {
  std::vector<Param> params;
  // Names of *args and **kwargs; empty if absent.
  std::string vararg;
  std::string kwarg;
};

struct Lambda : public Expr {
  Lambda() : Expr(ExprKind::kLambda) {}
  Signature signature;
  ExprPtr body;
};

struct FString : public Expr {
  struct Part {
    std::string literal;
    ExprPtr value;
    char conversion = 0;
    std::string spec;
  };
  FString() : Expr(ExprKind::kFString) {}
  std::vector<Part> parts;
};

struct Starred : public Expr {
  Starred() : Expr(ExprKind::kStarred) {}
  ExprPtr value;
};

enum class StmtKind {
  kExpr,
  kAssign,
  kAugAssign,
  kIf,
  kWhile,
  kFor,
  kBreak,
  kContinue,
  kPass,
  kFunctionDef,
  kReturn,
  kImport,
  kImportFrom,
  kTry,
  kRaise,
  kAssert,
  kDelete,
  kGlobal
};

struct Stmt : public Node {
  explicit Stmt(StmtKind kind) : kind(kind) {}
  virtual ~Stmt() = default;
  const StmtKind kind;
};

struct ExprStmt : public Stmt {
  ExprStmt() : Stmt(StmtKind::kExpr) {}
  ExprPtr value;
};

// targets[0] = targets[1] = ... = value
struct Assign : public Stmt {
  Assign() : Stmt(StmtKind::kAssign) {}
  std::vector<ExprPtr> targets;
  ExprPtr value;
};

struct AugAssign : public Stmt {
  AugAssign() : Stmt(StmtKind::kAugAssign) {}
  ExprPtr target;
  BinOp op = BinOp::kAdd;
  ExprPtr value;
};

// Also used for elif chains, which nest in orelse.
struct If : public Stmt {
  If() : Stmt(StmtKind::kIf) {}
  ExprPtr test;
  Body body;
  Body orelse;
};

struct While : public Stmt {
  While() : Stmt(StmtKind::kWhile) {}
  ExprPtr test;
  Body body;
  Body orelse;
};

struct For : public Stmt {
  For() : Stmt(StmtKind::kFor) {}
  ExprPtr target;
  ExprPtr iter;
  Body body;
  Body orelse;
};

struct Simple : public Stmt {
  explicit Simple(StmtKind kind) : Stmt(kind) {}
};

struct FunctionDef : public Stmt {
  FunctionDef() : Stmt(StmtKind::kFunctionDef) {}
  std::string name;
  Signature signature;
  Body body;
};

struct Return : public Stmt {
  Return() : Stmt(StmtKind::kReturn) {}
  ExprPtr value;
};

struct Alias {
  std::string name;
  std::string asname;
};

struct Import : public Stmt {
  Import() : Stmt(StmtKind::kImport) {}
  std::vector<Alias> names;
};

struct ImportFrom : public Stmt {
  ImportFrom() : Stmt(StmtKind::kImportFrom) {}
  std::string module;
  std::vector<Alias> names;
};

struct Handler {
  int line = 0;
  // Null for a bare except.
  ExprPtr type;
  std::string name;
  Body body;
};

struct Try : public Stmt {
  Try() : Stmt(StmtKind::kTry) {}
  Body body;
  std::vector<Handler> handlers;
  Body orelse;
  Body finalbody;
};

struct Raise : public Stmt {
  Raise() : Stmt(StmtKind::kRaise) {}
  ExprPtr exc;
  ExprPtr cause;
};

struct Assert : public Stmt {
  Assert() : Stmt(StmtKind::kAssert) {}
  ExprPtr test;
  ExprPtr msg;
};

struct Delete : public Stmt {
  Delete() : Stmt(StmtKind::kDelete) {}
  std::vector<ExprPtr> targets;
};

struct Global : public Stmt {
  Global() : Stmt(StmtKind::kGlobal) {}
  std::vector<std::string> names;
};

struct Module {
  Body body;
};

// Visits every node of a tree in source order, parents before children.
class Visitor {
 public:
  virtual ~Visitor() = default;
  virtual void VisitStmt(const Stmt& stmt) {}
  virtual void VisitExpr(const Expr& expr) {}
};

void Walk(const Module& module, Visitor* visitor);
void Walk(const Stmt& stmt, Visitor* visitor);
void Walk(const Expr& expr, Visitor* visitor);

}  // namespace ast
}  // namespace script

#endif
