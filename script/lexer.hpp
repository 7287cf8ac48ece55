#ifndef SCRIPT_LEXER_HPP
#define SCRIPT_LEXER_HPP

#include <string>
#include <vector>

namespace script {

enum class TokenType {
  kName,
  kKeyword,
  kInt,
  kFloat,
  kString,
  // An f-string; text holds the decoded literal with its {} fields.
  kFString,
  kOp,
  kNewline,
  kIndent,
  kDedent,
  kEnd
};

struct Token {
  TokenType type;
  std::string text;
  int line;
  int column;
};

// Splits source code into tokens, producing INDENT/DEDENT tokens from
// leading whitespace. Throws SyntaxError on malformed input.
class Lexer {
 public:
  explicit Lexer(const std::string& source) : source_(source) {}
  std::vector<Token> Tokenize();

  static bool IsKeyword(const std::string& word);

 private:
  char Peek(size_t offset = 0) const;
  char Advance();
  [[noreturn]] void Fail(const std::string& msg) const;

  // Handles indentation at the start of a logical line. Returns false if the
  // line is blank and was skipped entirely.
  bool ScanIndentation(std::vector<Token>* tokens);
  void ScanName(std::vector<Token>* tokens);
  void ScanNumber(std::vector<Token>* tokens);
  void ScanString(const std::string& prefix, std::vector<Token>* tokens);
  void ScanOperator(std::vector<Token>* tokens);
  void Emit(std::vector<Token>* tokens, TokenType type, std::string text);

  const std::string& source_;
  size_t pos_ = 0;
  int line_ = 1;
  int column_ = 1;
  int token_line_ = 1;
  int token_column_ = 1;
  int paren_depth_ = 0;
  std::vector<int> indents_{0};
};

}  // namespace script

#endif
