#include "script/parser.hpp"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <functional>

#include "absl/memory/memory.h"
#include "script/errors.hpp"

namespace script {

namespace {

static const constexpr int kMaxDepth = 100;

template <typename T, typename... Args>
std::unique_ptr<T> NewNode(const Token& at, Args&&... args) {
  auto node = absl::make_unique<T>(std::forward<Args>(args)...);
  node->line = at.line;
  node->column = at.column;
  return node;
}

bool AugmentedOp(const std::string& text, ast::BinOp* op) {
  static const struct {
    const char* text;
    ast::BinOp op;
  } kOps[] = {{"+=", ast::BinOp::kAdd},       {"-=", ast::BinOp::kSub},
              {"*=", ast::BinOp::kMul},       {"/=", ast::BinOp::kDiv},
              {"//=", ast::BinOp::kFloorDiv}, {"%=", ast::BinOp::kMod},
              {"**=", ast::BinOp::kPow},      {"&=", ast::BinOp::kBitAnd},
              {"|=", ast::BinOp::kBitOr},     {"^=", ast::BinOp::kBitXor},
              {"<<=", ast::BinOp::kLShift},   {">>=", ast::BinOp::kRShift}};
  for (const auto& entry : kOps) {
    if (text == entry.text) {
      *op = entry.op;
      return true;
    }
  }
  return false;
}

}  // namespace

class Parser::DepthGuard {
 public:
  explicit DepthGuard(Parser* parser) : parser_(parser) {
    if (++parser_->depth_ > kMaxDepth) parser_->Fail("too many nested levels");
  }
  ~DepthGuard() { parser_->depth_--; }
  DepthGuard(const DepthGuard&) = delete;
  DepthGuard& operator=(const DepthGuard&) = delete;

 private:
  Parser* parser_;
};

Parser::Parser(std::vector<Token> tokens, int line_offset)
    : tokens_(std::move(tokens)) {
  for (Token& token : tokens_) token.line += line_offset;
}

const Token& Parser::Peek(size_t offset) const {
  size_t index = pos_ + offset;
  return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

const Token& Parser::Next() {
  const Token& token = Peek();
  if (pos_ < tokens_.size() - 1) pos_++;
  return token;
}

bool Parser::AtOp(const char* op, size_t offset) const {
  const Token& token = Peek(offset);
  return token.type == TokenType::kOp && token.text == op;
}

bool Parser::AtKeyword(const char* keyword, size_t offset) const {
  const Token& token = Peek(offset);
  return token.type == TokenType::kKeyword && token.text == keyword;
}

bool Parser::AcceptOp(const char* op) {
  if (!AtOp(op)) return false;
  Next();
  return true;
}

bool Parser::AcceptKeyword(const char* keyword) {
  if (!AtKeyword(keyword)) return false;
  Next();
  return true;
}

const Token& Parser::ExpectOp(const char* op) {
  if (!AtOp(op)) Fail(std::string("expected '") + op + "'");
  return Next();
}

void Parser::ExpectKeyword(const char* keyword) {
  if (!AtKeyword(keyword)) Fail(std::string("expected '") + keyword + "'");
  Next();
}

std::string Parser::ExpectName() {
  if (Peek().type != TokenType::kName) Fail("expected a name");
  return Next().text;
}

void Parser::ExpectNewline() {
  if (Peek().type == TokenType::kEnd) return;
  if (Peek().type != TokenType::kNewline) Fail("invalid syntax");
  Next();
}

void Parser::Fail(const std::string& msg) const { Fail(msg, Peek()); }

void Parser::Fail(const std::string& msg, const Token& at) const {
  throw SyntaxError(msg, at.line, at.column);
}

std::unique_ptr<ast::Module> Parser::ParseModule() {
  auto module = absl::make_unique<ast::Module>();
  while (Peek().type != TokenType::kEnd) ParseStatement(&module->body);
  return module;
}

ast::ExprPtr Parser::ParseStandaloneExpression() {
  ast::ExprPtr expr = ParseTestList();
  if (Peek().type == TokenType::kNewline) Next();
  if (Peek().type != TokenType::kEnd) Fail("invalid syntax");
  return expr;
}

void Parser::ParseStatement(ast::Body* body) {
  const Token& token = Peek();
  if (token.type == TokenType::kIndent) Fail("unexpected indent");
  if (token.type == TokenType::kDedent) Fail("unexpected unindent");
  if (token.type == TokenType::kNewline) {
    Next();
    return;
  }
  if (token.type == TokenType::kKeyword) {
    const std::string& word = token.text;
    if (word == "if") return body->push_back(ParseIf());
    if (word == "while") return body->push_back(ParseWhile());
    if (word == "for") return body->push_back(ParseFor());
    if (word == "try") return body->push_back(ParseTry());
    if (word == "def") return body->push_back(ParseFunctionDef());
    if (word == "class") Fail("class definitions are not supported");
    if (word == "with") Fail("with statements are not supported");
    if (word == "async" || word == "await" || word == "yield")
      Fail("'" + word + "' is not supported");
  }
  if (AtOp("@")) Fail("decorators are not supported");
  ParseSimpleStatements(body);
}

void Parser::ParseSimpleStatements(ast::Body* body) {
  body->push_back(ParseSmallStatement());
  while (AcceptOp(";")) {
    if (Peek().type == TokenType::kNewline || Peek().type == TokenType::kEnd)
      break;
    body->push_back(ParseSmallStatement());
  }
  ExpectNewline();
}

ast::StmtPtr Parser::ParseSmallStatement() {
  const Token& token = Peek();
  if (token.type != TokenType::kKeyword) return ParseExpressionStatement();
  const std::string& word = token.text;
  if (word == "pass" || word == "break" || word == "continue") {
    if (word != "pass" && loop_depth_ == 0)
      Fail("'" + word + "' outside loop");
    Next();
    ast::StmtKind kind = word == "pass"    ? ast::StmtKind::kPass
                         : word == "break" ? ast::StmtKind::kBreak
                                           : ast::StmtKind::kContinue;
    return NewNode<ast::Simple>(token, kind);
  }
  if (word == "return") {
    if (function_depth_ == 0) Fail("'return' outside function");
    auto node = NewNode<ast::Return>(Next());
    if (Peek().type != TokenType::kNewline && !AtOp(";") &&
        Peek().type != TokenType::kEnd)
      node->value = ParseTestList(true);
    return std::move(node);
  }
  if (word == "raise") {
    auto node = NewNode<ast::Raise>(Next());
    if (Peek().type != TokenType::kNewline && !AtOp(";") &&
        Peek().type != TokenType::kEnd) {
      node->exc = ParseTest();
      if (AcceptKeyword("from")) node->cause = ParseTest();
    }
    return std::move(node);
  }
  if (word == "global") {
    auto node = NewNode<ast::Global>(Next());
    do {
      node->names.push_back(ExpectName());
    } while (AcceptOp(","));
    return std::move(node);
  }
  if (word == "nonlocal") Fail("nonlocal is not supported");
  if (word == "del") {
    auto node = NewNode<ast::Delete>(Next());
    do {
      node->targets.push_back(ParseBitOr());
      CheckAssignable(*node->targets.back());
    } while (AcceptOp(","));
    return std::move(node);
  }
  if (word == "assert") {
    auto node = NewNode<ast::Assert>(Next());
    node->test = ParseTest();
    if (AcceptOp(",")) node->msg = ParseTest();
    return std::move(node);
  }
  if (word == "import") return ParseImport();
  if (word == "from") return ParseFromImport();
  return ParseExpressionStatement();
}

ast::StmtPtr Parser::ParseExpressionStatement() {
  const Token& start = Peek();
  ast::ExprPtr first = ParseTestList(true);
  ast::BinOp op;
  if (Peek().type == TokenType::kOp && AugmentedOp(Peek().text, &op)) {
    Next();
    if (first->kind != ast::ExprKind::kName &&
        first->kind != ast::ExprKind::kAttribute &&
        first->kind != ast::ExprKind::kSubscript)
      Fail("illegal expression for augmented assignment", start);
    auto node = NewNode<ast::AugAssign>(start);
    node->target = std::move(first);
    node->op = op;
    node->value = ParseTestList(true);
    return std::move(node);
  }
  if (AtOp(":")) {
    // Annotated assignment; the annotation is ignored.
    if (first->kind != ast::ExprKind::kName &&
        first->kind != ast::ExprKind::kAttribute &&
        first->kind != ast::ExprKind::kSubscript)
      Fail("illegal target for annotation", start);
    Next();
    ParseTest();
    if (!AcceptOp("=")) {
      auto node = NewNode<ast::Simple>(start, ast::StmtKind::kPass);
      return std::move(node);
    }
    auto node = NewNode<ast::Assign>(start);
    node->targets.push_back(std::move(first));
    node->value = ParseTestList(true);
    return std::move(node);
  }
  if (!AtOp("=")) {
    auto node = NewNode<ast::ExprStmt>(start);
    node->value = std::move(first);
    return std::move(node);
  }
  auto node = NewNode<ast::Assign>(start);
  ast::ExprPtr value = std::move(first);
  while (AcceptOp("=")) {
    CheckAssignable(*value);
    node->targets.push_back(std::move(value));
    value = ParseTestList(true);
  }
  node->value = std::move(value);
  return std::move(node);
}

void Parser::CheckAssignable(const ast::Expr& target) const {
  switch (target.kind) {
    case ast::ExprKind::kName:
    case ast::ExprKind::kAttribute:
    case ast::ExprKind::kSubscript:
      return;
    case ast::ExprKind::kList:
    case ast::ExprKind::kTuple:
      for (const ast::ExprPtr& elt :
           static_cast<const ast::Sequence&>(target).elts)
        CheckAssignable(*elt);
      return;
    default:
      throw SyntaxError("cannot assign to expression", target.line,
                        target.column);
  }
}

std::string Parser::ParseDottedName() {
  if (AtOp(".") || AtOp("..."))
    Fail("relative imports are not supported");
  std::string name = ExpectName();
  while (AcceptOp(".")) name += "." + ExpectName();
  return name;
}

ast::StmtPtr Parser::ParseImport() {
  auto node = NewNode<ast::Import>(Next());
  do {
    ast::Alias alias;
    alias.name = ParseDottedName();
    if (AcceptKeyword("as")) alias.asname = ExpectName();
    node->names.push_back(std::move(alias));
  } while (AcceptOp(","));
  return std::move(node);
}

ast::StmtPtr Parser::ParseFromImport() {
  auto node = NewNode<ast::ImportFrom>(Next());
  node->module = ParseDottedName();
  ExpectKeyword("import");
  if (AcceptOp("*")) {
    node->names.push_back(ast::Alias{"*", ""});
    return std::move(node);
  }
  bool parenthesized = AcceptOp("(");
  do {
    if (parenthesized && AtOp(")")) break;
    ast::Alias alias;
    alias.name = ExpectName();
    if (AcceptKeyword("as")) alias.asname = ExpectName();
    node->names.push_back(std::move(alias));
  } while (AcceptOp(","));
  if (parenthesized) ExpectOp(")");
  return std::move(node);
}

ast::Body Parser::ParseBlock() {
  DepthGuard guard(this);
  ExpectOp(":");
  ast::Body body;
  if (Peek().type != TokenType::kNewline) {
    ParseSimpleStatements(&body);
    return body;
  }
  Next();
  if (Peek().type != TokenType::kIndent) Fail("expected an indented block");
  Next();
  while (Peek().type != TokenType::kDedent && Peek().type != TokenType::kEnd)
    ParseStatement(&body);
  if (Peek().type == TokenType::kDedent) Next();
  return body;
}

ast::StmtPtr Parser::ParseIf() {
  auto node = NewNode<ast::If>(Next());
  node->test = ParseTest();
  node->body = ParseBlock();
  if (AtKeyword("elif")) {
    node->orelse.push_back(ParseIf());
  } else if (AcceptKeyword("else")) {
    node->orelse = ParseBlock();
  }
  return std::move(node);
}

ast::StmtPtr Parser::ParseWhile() {
  auto node = NewNode<ast::While>(Next());
  node->test = ParseTest();
  loop_depth_++;
  node->body = ParseBlock();
  loop_depth_--;
  if (AcceptKeyword("else")) node->orelse = ParseBlock();
  return std::move(node);
}

ast::StmtPtr Parser::ParseFor() {
  auto node = NewNode<ast::For>(Next());
  node->target = ParseTargetList();
  ExpectKeyword("in");
  node->iter = ParseTestList();
  loop_depth_++;
  node->body = ParseBlock();
  loop_depth_--;
  if (AcceptKeyword("else")) node->orelse = ParseBlock();
  return std::move(node);
}

ast::StmtPtr Parser::ParseTry() {
  auto node = NewNode<ast::Try>(Next());
  node->body = ParseBlock();
  while (AtKeyword("except")) {
    ast::Handler handler;
    handler.line = Next().line;
    if (!AtOp(":")) {
      handler.type = ParseTest();
      if (AcceptKeyword("as")) handler.name = ExpectName();
    }
    handler.body = ParseBlock();
    node->handlers.push_back(std::move(handler));
  }
  if (!node->handlers.empty() && AcceptKeyword("else"))
    node->orelse = ParseBlock();
  if (AcceptKeyword("finally")) node->finalbody = ParseBlock();
  if (node->handlers.empty() && node->finalbody.empty())
    Fail("expected 'except' or 'finally' block");
  return std::move(node);
}

ast::StmtPtr Parser::ParseFunctionDef() {
  auto node = NewNode<ast::FunctionDef>(Next());
  node->name = ExpectName();
  ExpectOp("(");
  node->signature = ParseSignature(")", true);
  ExpectOp(")");
  if (AcceptOp("->")) ParseTest();
  int loop_depth = loop_depth_;
  loop_depth_ = 0;
  function_depth_++;
  node->body = ParseBlock();
  function_depth_--;
  loop_depth_ = loop_depth;
  return std::move(node);
}

ast::Signature Parser::ParseSignature(const char* closing, bool annotations) {
  ast::Signature signature;
  bool seen_default = false;
  while (!AtOp(closing)) {
    if (AcceptOp("**")) {
      signature.kwarg = ExpectName();
      if (annotations && AcceptOp(":")) ParseTest();
    } else if (AcceptOp("*")) {
      if (Peek().type == TokenType::kName) {
        signature.vararg = ExpectName();
        if (annotations && AcceptOp(":")) ParseTest();
      }
    } else if (AcceptOp("/")) {
      // Positional-only marker, no effect here.
    } else {
      if (!signature.kwarg.empty()) Fail("parameter after **kwargs");
      ast::Param param;
      param.name = ExpectName();
      for (const ast::Param& other : signature.params) {
        if (other.name == param.name)
          Fail("duplicate argument '" + param.name + "'");
      }
      if (annotations && AcceptOp(":")) ParseTest();
      if (AcceptOp("=")) {
        param.default_value = ParseTest();
        seen_default = true;
      } else if (seen_default && signature.vararg.empty()) {
        Fail("non-default argument follows default argument");
      }
      signature.params.push_back(std::move(param));
    }
    if (!AcceptOp(",")) break;
  }
  return signature;
}

ast::ExprPtr Parser::ParseTestList(bool allow_starred) {
  const Token& start = Peek();
  auto parse_one = [this, allow_starred]() -> ast::ExprPtr {
    if (allow_starred && AtOp("*")) {
      auto starred = NewNode<ast::Starred>(Next());
      starred->value = ParseBitOr();
      return std::move(starred);
    }
    return ParseTest();
  };
  ast::ExprPtr first = parse_one();
  if (!AtOp(",")) return first;
  auto tuple = NewNode<ast::Sequence>(start, ast::ExprKind::kTuple);
  tuple->elts.push_back(std::move(first));
  while (AcceptOp(",")) {
    const Token& next = Peek();
    if (next.type == TokenType::kNewline || next.type == TokenType::kEnd ||
        AtOp("=") || AtOp(")") || AtOp(";") || AtOp(":") ||
        (next.type == TokenType::kOp && next.text.size() >= 2 &&
         next.text.back() == '='))
      break;
    tuple->elts.push_back(parse_one());
  }
  return std::move(tuple);
}

ast::ExprPtr Parser::ParseTargetList() {
  const Token& start = Peek();
  ast::ExprPtr first = ParseBitOr();
  CheckAssignable(*first);
  if (!AtOp(",")) return first;
  auto tuple = NewNode<ast::Sequence>(start, ast::ExprKind::kTuple);
  tuple->elts.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (AtKeyword("in")) break;
    tuple->elts.push_back(ParseBitOr());
    CheckAssignable(*tuple->elts.back());
  }
  return std::move(tuple);
}

ast::ExprPtr Parser::ParseTest() {
  DepthGuard guard(this);
  if (AtKeyword("lambda")) return ParseLambda();
  const Token& start = Peek();
  ast::ExprPtr body = ParseOr();
  if (!AtKeyword("if")) return body;
  Next();
  auto node = NewNode<ast::IfExp>(start);
  node->body = std::move(body);
  node->test = ParseOr();
  ExpectKeyword("else");
  node->orelse = ParseTest();
  return std::move(node);
}

ast::ExprPtr Parser::ParseLambda() {
  auto node = NewNode<ast::Lambda>(Next());
  node->signature = ParseSignature(":", false);
  ExpectOp(":");
  node->body = ParseTest();
  return std::move(node);
}

ast::ExprPtr Parser::ParseOr() {
  const Token& start = Peek();
  ast::ExprPtr first = ParseAnd();
  if (!AtKeyword("or")) return first;
  auto node = NewNode<ast::BoolOp>(start);
  node->is_and = false;
  node->values.push_back(std::move(first));
  while (AcceptKeyword("or")) node->values.push_back(ParseAnd());
  return std::move(node);
}

ast::ExprPtr Parser::ParseAnd() {
  const Token& start = Peek();
  ast::ExprPtr first = ParseNot();
  if (!AtKeyword("and")) return first;
  auto node = NewNode<ast::BoolOp>(start);
  node->is_and = true;
  node->values.push_back(std::move(first));
  while (AcceptKeyword("and")) node->values.push_back(ParseNot());
  return std::move(node);
}

ast::ExprPtr Parser::ParseNot() {
  if (!AtKeyword("not")) return ParseComparison();
  DepthGuard guard(this);
  auto node = NewNode<ast::Unary>(Next());
  node->op = ast::UnaryOp::kNot;
  node->operand = ParseNot();
  return std::move(node);
}

ast::ExprPtr Parser::ParseComparison() {
  const Token& start = Peek();
  ast::ExprPtr left = ParseBitOr();
  std::unique_ptr<ast::Compare> node;
  while (true) {
    ast::CmpOp op;
    const Token& token = Peek();
    if (token.type == TokenType::kOp && token.text == "==") {
      op = ast::CmpOp::kEq;
    } else if (token.type == TokenType::kOp && token.text == "!=") {
      op = ast::CmpOp::kNe;
    } else if (token.type == TokenType::kOp && token.text == "<") {
      op = ast::CmpOp::kLt;
    } else if (token.type == TokenType::kOp && token.text == "<=") {
      op = ast::CmpOp::kLe;
    } else if (token.type == TokenType::kOp && token.text == ">") {
      op = ast::CmpOp::kGt;
    } else if (token.type == TokenType::kOp && token.text == ">=") {
      op = ast::CmpOp::kGe;
    } else if (AtKeyword("in")) {
      op = ast::CmpOp::kIn;
    } else if (AtKeyword("not") && AtKeyword("in", 1)) {
      Next();
      op = ast::CmpOp::kNotIn;
    } else if (AtKeyword("is")) {
      if (AtKeyword("not", 1)) {
        Next();
        op = ast::CmpOp::kIsNot;
      } else {
        op = ast::CmpOp::kIs;
      }
    } else {
      break;
    }
    Next();
    if (!node) {
      node = NewNode<ast::Compare>(start);
      node->left = std::move(left);
    }
    node->ops.push_back(op);
    node->comparators.push_back(ParseBitOr());
  }
  if (!node) return left;
  return std::move(node);
}

namespace {

template <typename Next>
ast::ExprPtr ParseBinaryLevel(
    const Token& start, Next next,
    const std::function<bool(ast::BinOp*)>& accept) {
  ast::ExprPtr left = next();
  ast::BinOp op;
  while (accept(&op)) {
    auto node = NewNode<ast::Binary>(start);
    node->op = op;
    node->left = std::move(left);
    node->right = next();
    left = std::move(node);
  }
  return left;
}

}  // namespace

ast::ExprPtr Parser::ParseBitOr() {
  return ParseBinaryLevel(
      Peek(), [this] { return ParseBitXor(); },
      [this](ast::BinOp* op) {
        *op = ast::BinOp::kBitOr;
        return AcceptOp("|");
      });
}

ast::ExprPtr Parser::ParseBitXor() {
  return ParseBinaryLevel(
      Peek(), [this] { return ParseBitAnd(); },
      [this](ast::BinOp* op) {
        *op = ast::BinOp::kBitXor;
        return AcceptOp("^");
      });
}

ast::ExprPtr Parser::ParseBitAnd() {
  return ParseBinaryLevel(
      Peek(), [this] { return ParseShift(); },
      [this](ast::BinOp* op) {
        *op = ast::BinOp::kBitAnd;
        return AcceptOp("&");
      });
}

ast::ExprPtr Parser::ParseShift() {
  return ParseBinaryLevel(
      Peek(), [this] { return ParseArith(); },
      [this](ast::BinOp* op) {
        if (AcceptOp("<<")) {
          *op = ast::BinOp::kLShift;
          return true;
        }
        *op = ast::BinOp::kRShift;
        return AcceptOp(">>");
      });
}

ast::ExprPtr Parser::ParseArith() {
  return ParseBinaryLevel(
      Peek(), [this] { return ParseTerm(); },
      [this](ast::BinOp* op) {
        if (AcceptOp("+")) {
          *op = ast::BinOp::kAdd;
          return true;
        }
        *op = ast::BinOp::kSub;
        return AcceptOp("-");
      });
}

ast::ExprPtr Parser::ParseTerm() {
  return ParseBinaryLevel(
      Peek(), [this] { return ParseFactor(); },
      [this](ast::BinOp* op) {
        if (AtOp("@")) Fail("matrix multiplication is not supported");
        if (AcceptOp("*")) {
          *op = ast::BinOp::kMul;
        } else if (AcceptOp("/")) {
          *op = ast::BinOp::kDiv;
        } else if (AcceptOp("//")) {
          *op = ast::BinOp::kFloorDiv;
        } else if (AcceptOp("%")) {
          *op = ast::BinOp::kMod;
        } else {
          return false;
        }
        return true;
      });
}

ast::ExprPtr Parser::ParseFactor() {
  ast::UnaryOp op;
  if (AtOp("-")) {
    op = ast::UnaryOp::kNeg;
  } else if (AtOp("+")) {
    op = ast::UnaryOp::kPos;
  } else if (AtOp("~")) {
    op = ast::UnaryOp::kInvert;
  } else {
    return ParsePower();
  }
  DepthGuard guard(this);
  auto node = NewNode<ast::Unary>(Next());
  node->op = op;
  node->operand = ParseFactor();
  return std::move(node);
}

ast::ExprPtr Parser::ParsePower() {
  const Token& start = Peek();
  ast::ExprPtr base = ParseAtomExpr();
  if (!AtOp("**")) return base;
  Next();
  DepthGuard guard(this);
  auto node = NewNode<ast::Binary>(start);
  node->op = ast::BinOp::kPow;
  node->left = std::move(base);
  node->right = ParseFactor();
  return std::move(node);
}

ast::ExprPtr Parser::ParseAtomExpr() {
  const Token& start = Peek();
  ast::ExprPtr expr = ParseAtom();
  int trailers = 0;
  while (true) {
    if (++trailers > kMaxDepth) Fail("too many nested levels");
    if (AtOp("(")) {
      const Token& at = Next();
      expr = ParseCall(std::move(expr), at);
    } else if (AtOp("[")) {
      const Token& at = Next();
      expr = ParseSubscript(std::move(expr), at);
    } else if (AtOp(".")) {
      Next();
      auto node = NewNode<ast::Attribute>(start);
      node->value = std::move(expr);
      node->attr = ExpectName();
      expr = std::move(node);
    } else {
      return expr;
    }
  }
}

ast::ExprPtr Parser::ParseCall(ast::ExprPtr func, const Token& at) {
  DepthGuard guard(this);
  auto node = NewNode<ast::Call>(at);
  node->func = std::move(func);
  while (!AtOp(")")) {
    if (AtOp("**")) Fail("'**' arguments are not supported");
    if (AtOp("*")) {
      auto starred = NewNode<ast::Starred>(Next());
      starred->value = ParseTest();
      node->args.push_back(std::move(starred));
    } else if (Peek().type == TokenType::kName && AtOp("=", 1)) {
      ast::Keyword keyword;
      keyword.name = Next().text;
      Next();
      keyword.value = ParseTest();
      for (const ast::Keyword& other : node->keywords) {
        if (other.name == keyword.name)
          Fail("keyword argument repeated: " + keyword.name);
      }
      node->keywords.push_back(std::move(keyword));
    } else {
      if (!node->keywords.empty())
        Fail("positional argument follows keyword argument");
      const Token& start = Peek();
      ast::ExprPtr arg = ParseTest();
      if (AtKeyword("for")) {
        auto comp = NewNode<ast::Comp>(start, ast::ExprKind::kListComp);
        comp->elt = std::move(arg);
        comp->generators = ParseComprehensions();
        arg = std::move(comp);
      }
      node->args.push_back(std::move(arg));
    }
    if (!AcceptOp(",")) break;
  }
  ExpectOp(")");
  return std::move(node);
}

ast::ExprPtr Parser::ParseSubscript(ast::ExprPtr value, const Token& at) {
  DepthGuard guard(this);
  auto node = NewNode<ast::Subscript>(at);
  node->value = std::move(value);
  ast::ExprPtr lower;
  if (!AtOp(":")) lower = ParseTestList();
  if (AtOp(":")) {
    auto slice = NewNode<ast::Slice>(Peek());
    Next();
    slice->lower = std::move(lower);
    if (!AtOp("]") && !AtOp(":")) slice->upper = ParseTest();
    if (AcceptOp(":") && !AtOp("]")) slice->step = ParseTest();
    node->index = std::move(slice);
  } else {
    node->index = std::move(lower);
  }
  ExpectOp("]");
  return std::move(node);
}

std::vector<ast::Comprehension> Parser::ParseComprehensions() {
  std::vector<ast::Comprehension> generators;
  while (AcceptKeyword("for")) {
    ast::Comprehension gen;
    gen.target = ParseTargetList();
    ExpectKeyword("in");
    gen.iter = ParseOr();
    while (AtKeyword("if")) {
      Next();
      gen.conditions.push_back(ParseOr());
    }
    generators.push_back(std::move(gen));
  }
  return generators;
}

ast::ExprPtr Parser::ParseAtom() {
  DepthGuard guard(this);
  const Token& token = Peek();
  switch (token.type) {
    case TokenType::kName:
      Next();
      return NewNode<ast::Name>(token, token.text);
    case TokenType::kInt:
    case TokenType::kFloat:
      Next();
      return ParseNumber(token);
    case TokenType::kString:
    case TokenType::kFString:
      return ParseStrings();
    case TokenType::kKeyword:
      if (token.text == "None" || token.text == "True" ||
          token.text == "False") {
        Next();
        Value value = token.text == "None" ? Value::None()
                                           : Value::Bool(token.text == "True");
        return NewNode<ast::Constant>(token, std::move(value));
      }
      if (token.text == "yield" || token.text == "await")
        Fail("'" + token.text + "' is not supported");
      Fail("invalid syntax");
    case TokenType::kOp:
      if (token.text == "(") {
        Next();
        return ParseParenthesized(token);
      }
      if (token.text == "[") {
        Next();
        return ParseListDisplay(token);
      }
      if (token.text == "{") {
        Next();
        return ParseDictDisplay(token);
      }
      if (token.text == "...") {
        Next();
        return NewNode<ast::Constant>(token, Value::None());
      }
      Fail("invalid syntax");
    case TokenType::kIndent:
      Fail("unexpected indent");
    default:
      Fail("invalid syntax");
  }
}

ast::ExprPtr Parser::ParseParenthesized(const Token& at) {
  if (AcceptOp(")")) return NewNode<ast::Sequence>(at, ast::ExprKind::kTuple);
  const Token& start = Peek();
  ast::ExprPtr first;
  if (AtOp("*")) {
    auto starred = NewNode<ast::Starred>(Next());
    starred->value = ParseBitOr();
    first = std::move(starred);
  } else {
    first = ParseTest();
  }
  if (AtKeyword("for")) {
    auto comp = NewNode<ast::Comp>(start, ast::ExprKind::kListComp);
    comp->elt = std::move(first);
    comp->generators = ParseComprehensions();
    ExpectOp(")");
    return std::move(comp);
  }
  if (AcceptOp(")")) {
    if (first->kind == ast::ExprKind::kStarred)
      Fail("cannot use starred expression here", start);
    return first;
  }
  auto tuple = NewNode<ast::Sequence>(at, ast::ExprKind::kTuple);
  tuple->elts.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (AtOp(")")) break;
    if (AtOp("*")) {
      auto starred = NewNode<ast::Starred>(Next());
      starred->value = ParseBitOr();
      tuple->elts.push_back(std::move(starred));
    } else {
      tuple->elts.push_back(ParseTest());
    }
  }
  ExpectOp(")");
  return std::move(tuple);
}

ast::ExprPtr Parser::ParseListDisplay(const Token& at) {
  auto list = NewNode<ast::Sequence>(at, ast::ExprKind::kList);
  if (AcceptOp("]")) return std::move(list);
  const Token& start = Peek();
  bool starred = AtOp("*");
  ast::ExprPtr first;
  if (starred) {
    auto node = NewNode<ast::Starred>(Next());
    node->value = ParseBitOr();
    first = std::move(node);
  } else {
    first = ParseTest();
  }
  if (!starred && AtKeyword("for")) {
    auto comp = NewNode<ast::Comp>(start, ast::ExprKind::kListComp);
    comp->elt = std::move(first);
    comp->generators = ParseComprehensions();
    ExpectOp("]");
    return std::move(comp);
  }
  list->elts.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (AtOp("]")) break;
    if (AtOp("*")) {
      auto node = NewNode<ast::Starred>(Next());
      node->value = ParseBitOr();
      list->elts.push_back(std::move(node));
    } else {
      list->elts.push_back(ParseTest());
    }
  }
  ExpectOp("]");
  return std::move(list);
}

ast::ExprPtr Parser::ParseDictDisplay(const Token& at) {
  auto dict = NewNode<ast::DictDisplay>(at);
  if (AcceptOp("}")) return std::move(dict);
  if (AtOp("**")) Fail("dict unpacking is not supported");
  ast::ExprPtr key = ParseTest();
  if (!AtOp(":")) Fail("set literals are not supported");
  Next();
  ast::ExprPtr value = ParseTest();
  if (AtKeyword("for")) {
    auto comp = NewNode<ast::Comp>(at, ast::ExprKind::kDictComp);
    comp->elt = std::move(key);
    comp->value = std::move(value);
    comp->generators = ParseComprehensions();
    ExpectOp("}");
    return std::move(comp);
  }
  dict->keys.push_back(std::move(key));
  dict->values.push_back(std::move(value));
  while (AcceptOp(",")) {
    if (AtOp("}")) break;
    if (AtOp("**")) Fail("dict unpacking is not supported");
    dict->keys.push_back(ParseTest());
    ExpectOp(":");
    dict->values.push_back(ParseTest());
  }
  ExpectOp("}");
  return std::move(dict);
}

ast::ExprPtr Parser::ParseNumber(const Token& token) {
  const std::string& text = token.text;
  if (token.type == TokenType::kFloat) {
    return NewNode<ast::Constant>(token,
                                  Value::Float(strtod(text.c_str(), nullptr)));
  }
  int base = 10;
  std::string digits = text;
  if (text.size() > 2 && text[0] == '0' &&
      (text[1] == 'x' || text[1] == 'o' || text[1] == 'b')) {
    base = text[1] == 'x' ? 16 : text[1] == 'o' ? 8 : 2;
    digits = text.substr(2);
  } else if (text.size() > 1 && text[0] == '0' &&
             text.find_first_not_of('0') != std::string::npos) {
    Fail("leading zeros in decimal integer literals are not permitted", token);
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long value = strtoull(digits.c_str(), &end, base);
  if (*end != '\0') Fail("invalid digit in number literal", token);
  if (errno == ERANGE || value > static_cast<unsigned long long>(INT64_MAX))
    Fail("integer literal too large", token);
  return NewNode<ast::Constant>(token,
                                Value::Int(static_cast<int64_t>(value)));
}

ast::ExprPtr Parser::ParseStrings() {
  const Token& start = Peek();
  bool format = false;
  for (size_t i = 0; Peek(i).type == TokenType::kString ||
                     Peek(i).type == TokenType::kFString;
       i++) {
    if (Peek(i).type == TokenType::kFString) format = true;
  }
  if (!format) {
    std::string value;
    while (Peek().type == TokenType::kString) value += Next().text;
    return NewNode<ast::Constant>(start, Value::Str(std::move(value)));
  }
  auto node = NewNode<ast::FString>(start);
  while (Peek().type == TokenType::kString ||
         Peek().type == TokenType::kFString) {
    const Token& token = Next();
    if (token.type == TokenType::kString) {
      ast::FString::Part part;
      part.literal = token.text;
      node->parts.push_back(std::move(part));
    } else {
      ParseFStringInto(token, node.get());
    }
  }
  return std::move(node);
}

void Parser::ParseFStringInto(const Token& token, ast::FString* node) {
  const std::string& text = token.text;
  std::string literal;
  size_t i = 0;
  auto flush = [&literal, node]() {
    if (literal.empty()) return;
    ast::FString::Part part;
    part.literal = std::move(literal);
    node->parts.push_back(std::move(part));
    literal.clear();
  };
  while (i < text.size()) {
    char c = text[i];
    if (c == '}') {
      if (i + 1 < text.size() && text[i + 1] == '}') {
        literal += '}';
        i += 2;
        continue;
      }
      Fail("f-string: single '}' is not allowed", token);
    }
    if (c != '{') {
      literal += c;
      i++;
      continue;
    }
    if (i + 1 < text.size() && text[i + 1] == '{') {
      literal += '{';
      i += 2;
      continue;
    }
    // Find the end of the expression: a top-level '!', ':' or '}'.
    size_t start = ++i;
    int nesting = 0;
    char quote = 0;
    for (; i < text.size(); i++) {
      char d = text[i];
      if (quote) {
        if (d == quote) quote = 0;
        continue;
      }
      if (d == '\'' || d == '"') {
        quote = d;
      } else if (d == '(' || d == '[' || d == '{') {
        nesting++;
      } else if (d == ')' || d == ']' || (d == '}' && nesting > 0)) {
        nesting--;
      } else if (nesting == 0 &&
                 (d == '}' || d == ':' ||
                  (d == '!' && i + 1 < text.size() && text[i + 1] != '='))) {
        break;
      }
    }
    if (i >= text.size()) Fail("f-string: expecting '}'", token);
    std::string expr_text = text.substr(start, i - start);
    ast::FString::Part part;
    bool self_documenting = false;
    // f"{x=}" prints the expression text before the value.
    size_t last = expr_text.find_last_not_of(" ");
    if (last != std::string::npos && expr_text[last] == '=' &&
        (last == 0 || std::string("=!<>").find(expr_text[last - 1]) ==
                          std::string::npos)) {
      literal += expr_text;
      expr_text = expr_text.substr(0, last);
      self_documenting = true;
    }
    if (expr_text.find_first_not_of(" \t\n") == std::string::npos)
      Fail("f-string: empty expression not allowed", token);
    flush();
    if (text[i] == '!') {
      if (i + 1 >= text.size() ||
          (text[i + 1] != 'r' && text[i + 1] != 's' && text[i + 1] != 'a'))
        Fail("f-string: invalid conversion character", token);
      part.conversion = text[i + 1] == 'a' ? 'r' : text[i + 1];
      i += 2;
    }
    if (i < text.size() && text[i] == ':') {
      size_t spec_start = ++i;
      while (i < text.size() && text[i] != '}') i++;
      part.spec = text.substr(spec_start, i - spec_start);
    }
    if (i >= text.size() || text[i] != '}')
      Fail("f-string: expecting '}'", token);
    i++;
    // Without a conversion or a format spec, "=" defaults to repr().
    if (self_documenting && part.conversion == 0 && part.spec.empty())
      part.conversion = 'r';
    std::string wrapped = "(" + expr_text + ")";
    Lexer lexer(wrapped);
    Parser parser(lexer.Tokenize(), token.line - 1);
    parser.depth_ = depth_;
    part.value = parser.ParseStandaloneExpression();
    node->parts.push_back(std::move(part));
  }
  flush();
}

std::shared_ptr<const ast::Module> Parse(const std::string& source) {
  Lexer lexer(source);
  Parser parser(lexer.Tokenize());
  return std::shared_ptr<const ast::Module>(parser.ParseModule());
}

}  // namespace script
