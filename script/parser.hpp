#ifndef SCRIPT_PARSER_HPP
#define SCRIPT_PARSER_HPP

#include <memory>
#include <string>
#include <vector>

#include "script/ast.hpp"
#include "script/lexer.hpp"

namespace script {

// Recursive descent parser for the supported Python subset. All methods
// throw SyntaxError on invalid input.
class Parser {
 public:
  // line_offset is added to every line number, for code embedded in a
  // larger source such as f-string fields.
  explicit Parser(std::vector<Token> tokens, int line_offset = 0);

  std::unique_ptr<ast::Module> ParseModule();

  // Parses a single expression that must span all the tokens.
  ast::ExprPtr ParseStandaloneExpression();

 private:
  class DepthGuard;

  const Token& Peek(size_t offset = 0) const;
  const Token& Next();
  bool AtOp(const char* op, size_t offset = 0) const;
  bool AtKeyword(const char* keyword, size_t offset = 0) const;
  bool AcceptOp(const char* op);
  bool AcceptKeyword(const char* keyword);
  const Token& ExpectOp(const char* op);
  void ExpectKeyword(const char* keyword);
  std::string ExpectName();
  void ExpectNewline();
  [[noreturn]] void Fail(const std::string& msg) const;
  [[noreturn]] void Fail(const std::string& msg, const Token& at) const;

  // Statements.
  void ParseStatement(ast::Body* body);
  void ParseSimpleStatements(ast::Body* body);
  ast::StmtPtr ParseSmallStatement();
  ast::StmtPtr ParseExpressionStatement();
  ast::StmtPtr ParseImport();
  ast::StmtPtr ParseFromImport();
  ast::StmtPtr ParseIf();
  ast::StmtPtr ParseWhile();
  ast::StmtPtr ParseFor();
  ast::StmtPtr ParseTry();
  ast::StmtPtr ParseFunctionDef();
  ast::Body ParseBlock();
  std::string ParseDottedName();
  ast::Signature ParseSignature(const char* closing, bool annotations);

  // Expressions, from lowest to highest precedence.
  ast::ExprPtr ParseTestList(bool allow_starred = false);
  ast::ExprPtr ParseTargetList();
  ast::ExprPtr ParseTest();
  ast::ExprPtr ParseLambda();
  ast::ExprPtr ParseOr();
  ast::ExprPtr ParseAnd();
  ast::ExprPtr ParseNot();
  ast::ExprPtr ParseComparison();
  ast::ExprPtr ParseBitOr();
  ast::ExprPtr ParseBitXor();
  ast::ExprPtr ParseBitAnd();
  ast::ExprPtr ParseShift();
  ast::ExprPtr ParseArith();
  ast::ExprPtr ParseTerm();
  ast::ExprPtr ParseFactor();
  ast::ExprPtr ParsePower();
  ast::ExprPtr ParseAtomExpr();
  ast::ExprPtr ParseAtom();
  ast::ExprPtr ParseCall(ast::ExprPtr func, const Token& at);
  ast::ExprPtr ParseSubscript(ast::ExprPtr value, const Token& at);
  ast::ExprPtr ParseParenthesized(const Token& at);
  ast::ExprPtr ParseListDisplay(const Token& at);
  ast::ExprPtr ParseDictDisplay(const Token& at);
  ast::ExprPtr ParseStrings();
  ast::ExprPtr ParseNumber(const Token& token);
  void ParseFStringInto(const Token& token, ast::FString* node);
  std::vector<ast::Comprehension> ParseComprehensions();
  void CheckAssignable(const ast::Expr& target) const;

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  int depth_ = 0;
  // Enclosing loops and functions, for break, continue and return.
  int loop_depth_ = 0;
  int function_depth_ = 0;
};

// Tokenizes and parses a whole program.
std::shared_ptr<const ast::Module> Parse(const std::string& source);

}  // namespace script

#endif
