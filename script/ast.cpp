#include "script/ast.hpp"

namespace script {
namespace ast {

namespace {

void WalkExpr(const ExprPtr& expr, Visitor* visitor) {
  if (expr) Walk(*expr, visitor);
}

void WalkBody(const Body& body, Visitor* visitor) {
  for (const StmtPtr& stmt : body) Walk(*stmt, visitor);
}

void WalkSignature(const Signature& signature, Visitor* visitor) {
  for (const Param& param : signature.params)
    WalkExpr(param.default_value, visitor);
}

}  // namespace

void Walk(const Module& module, Visitor* visitor) {
  WalkBody(module.body, visitor);
}

void Walk(const Stmt& stmt, Visitor* visitor) {
  visitor->VisitStmt(stmt);
  switch (stmt.kind) {
    case StmtKind::kExpr:
      WalkExpr(static_cast<const ExprStmt&>(stmt).value, visitor);
      break;
    case StmtKind::kAssign: {
      const auto& node = static_cast<const Assign&>(stmt);
      for (const ExprPtr& target : node.targets) WalkExpr(target, visitor);
      WalkExpr(node.value, visitor);
      break;
    }
    case StmtKind::kAugAssign: {
      const auto& node = static_cast<const AugAssign&>(stmt);
      WalkExpr(node.target, visitor);
      WalkExpr(node.value, visitor);
      break;
    }
    case StmtKind::kIf: {
      const auto& node = static_cast<const If&>(stmt);
      WalkExpr(node.test, visitor);
      WalkBody(node.body, visitor);
      WalkBody(node.orelse, visitor);
      break;
    }
    case StmtKind::kWhile: {
      const auto& node = static_cast<const While&>(stmt);
      WalkExpr(node.test, visitor);
      WalkBody(node.body, visitor);
      WalkBody(node.orelse, visitor);
      break;
    }
    case StmtKind::kFor: {
      const auto& node = static_cast<const For&>(stmt);
      WalkExpr(node.target, visitor);
      WalkExpr(node.iter, visitor);
      WalkBody(node.body, visitor);
      WalkBody(node.orelse, visitor);
      break;
    }
    case StmtKind::kFunctionDef: {
      const auto& node = static_cast<const FunctionDef&>(stmt);
      WalkSignature(node.signature, visitor);
      WalkBody(node.body, visitor);
      break;
    }
    case StmtKind::kReturn:
      WalkExpr(static_cast<const Return&>(stmt).value, visitor);
      break;
    case StmtKind::kTry: {
      const auto& node = static_cast<const Try&>(stmt);
      WalkBody(node.body, visitor);
      for (const Handler& handler : node.handlers) {
        WalkExpr(handler.type, visitor);
        WalkBody(handler.body, visitor);
      }
      WalkBody(node.orelse, visitor);
      WalkBody(node.finalbody, visitor);
      break;
    }
    case StmtKind::kRaise: {
      const auto& node = static_cast<const Raise&>(stmt);
      WalkExpr(node.exc, visitor);
      WalkExpr(node.cause, visitor);
      break;
    }
    case StmtKind::kAssert: {
      const auto& node = static_cast<const Assert&>(stmt);
      WalkExpr(node.test, visitor);
      WalkExpr(node.msg, visitor);
      break;
    }
    case StmtKind::kDelete:
      for (const ExprPtr& target : static_cast<const Delete&>(stmt).targets)
        WalkExpr(target, visitor);
      break;
    case StmtKind::kBreak:
    case StmtKind::kContinue:
    case StmtKind::kPass:
    case StmtKind::kImport:
    case StmtKind::kImportFrom:
    case StmtKind::kGlobal:
      break;
  }
}

void Walk(const Expr& expr, Visitor* visitor) {
  visitor->VisitExpr(expr);
  switch (expr.kind) {
    case ExprKind::kConstant:
    case ExprKind::kName:
      break;
    case ExprKind::kAttribute:
      WalkExpr(static_cast<const Attribute&>(expr).value, visitor);
      break;
    case ExprKind::kSubscript: {
      const auto& node = static_cast<const Subscript&>(expr);
      WalkExpr(node.value, visitor);
      WalkExpr(node.index, visitor);
      break;
    }
    case ExprKind::kSlice: {
      const auto& node = static_cast<const Slice&>(expr);
      WalkExpr(node.lower, visitor);
      WalkExpr(node.upper, visitor);
      WalkExpr(node.step, visitor);
      break;
    }
    case ExprKind::kCall: {
      const auto& node = static_cast<const Call&>(expr);
      WalkExpr(node.func, visitor);
      for (const ExprPtr& arg : node.args) WalkExpr(arg, visitor);
      for (const Keyword& keyword : node.keywords)
        WalkExpr(keyword.value, visitor);
      break;
    }
    case ExprKind::kBinary: {
      const auto& node = static_cast<const Binary&>(expr);
      WalkExpr(node.left, visitor);
      WalkExpr(node.right, visitor);
      break;
    }
    case ExprKind::kUnary:
      WalkExpr(static_cast<const Unary&>(expr).operand, visitor);
      break;
    case ExprKind::kBoolOp:
      for (const ExprPtr& value : static_cast<const BoolOp&>(expr).values)
        WalkExpr(value, visitor);
      break;
    case ExprKind::kCompare: {
      const auto& node = static_cast<const Compare&>(expr);
      WalkExpr(node.left, visitor);
      for (const ExprPtr& value : node.comparators) WalkExpr(value, visitor);
      break;
    }
    case ExprKind::kIfExp: {
      const auto& node = static_cast<const IfExp&>(expr);
      WalkExpr(node.test, visitor);
      WalkExpr(node.body, visitor);
      WalkExpr(node.orelse, visitor);
      break;
    }
    case ExprKind::kList:
    case ExprKind::kTuple:
      for (const ExprPtr& elt : static_cast<const Sequence&>(expr).elts)
        WalkExpr(elt, visitor);
      break;
    case ExprKind::kDict: {
      const auto& node = static_cast<const DictDisplay&>(expr);
      for (size_t i = 0; i < node.keys.size(); i++) {
        WalkExpr(node.keys[i], visitor);
        WalkExpr(node.values[i], visitor);
      }
      break;
    }
    case ExprKind::kListComp:
    case ExprKind::kDictComp: {
      const auto& node = static_cast<const Comp&>(expr);
      for (const Comprehension& gen : node.generators) {
        WalkExpr(gen.target, visitor);
        WalkExpr(gen.iter, visitor);
        for (const ExprPtr& cond : gen.conditions) WalkExpr(cond, visitor);
      }
      WalkExpr(node.elt, visitor);
      WalkExpr(node.value, visitor);
      break;
    }
    case ExprKind::kLambda: {
      const auto& node = static_cast<const Lambda&>(expr);
      WalkSignature(node.signature, visitor);
      WalkExpr(node.body, visitor);
      break;
    }
    case ExprKind::kFString:
      for (const FString::Part& part : static_cast<const FString&>(expr).parts)
        WalkExpr(part.value, visitor);
      break;
    case ExprKind::kStarred:
      WalkExpr(static_cast<const Starred&>(expr).value, visitor);
      break;
  }
}

}  // namespace ast
}  // namespace script
