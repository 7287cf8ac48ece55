#include "script/lexer.hpp"

#include <ctype.h>
#include <stdint.h>

#include <set>

#include "absl/strings/ascii.h"
#include "script/errors.hpp"

namespace {

static const constexpr size_t kMaxIndentLevels = 100;

bool IsNameStart(char c) {
  return isalpha(static_cast<unsigned char>(c)) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool IsNameChar(char c) {
  return IsNameStart(c) || isdigit(static_cast<unsigned char>(c));
}

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    *out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    *out += static_cast<char>(0xc0 | (cp >> 6));
    *out += static_cast<char>(0x80 | (cp & 0x3f));
  } else if (cp < 0x10000) {
    *out += static_cast<char>(0xe0 | (cp >> 12));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
    *out += static_cast<char>(0x80 | (cp & 0x3f));
  } else {
    *out += static_cast<char>(0xf0 | (cp >> 18));
    *out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
    *out += static_cast<char>(0x80 | (cp & 0x3f));
  }
}

}  // namespace

namespace script {

bool Lexer::IsKeyword(const std::string& word) {
  static const std::set<std::string>* keywords = new std::set<std::string>{
      "False",  "None",   "True",    "and",      "as",       "assert",
      "async",  "await",  "break",   "class",    "continue", "def",
      "del",    "elif",   "else",    "except",   "finally",  "for",
      "from",   "global", "if",      "import",   "in",       "is",
      "lambda", "nonlocal", "not",   "or",       "pass",     "raise",
      "return", "try",    "while",   "with",     "yield"};
  return keywords->count(word) != 0;
}

char Lexer::Peek(size_t offset) const {
  return pos_ + offset < source_.size() ? source_[pos_ + offset] : '\0';
}

char Lexer::Advance() {
  char c = source_[pos_++];
  if (c == '\n') {
    line_++;
    column_ = 1;
  } else {
    column_++;
  }
  return c;
}

void Lexer::Fail(const std::string& msg) const {
  throw SyntaxError(msg, line_, column_);
}

void Lexer::Emit(std::vector<Token>* tokens, TokenType type,
                 std::string text) {
  tokens->push_back(Token{type, std::move(text), token_line_, token_column_});
}

std::vector<Token> Lexer::Tokenize() {
  std::vector<Token> tokens;
  bool line_start = true;
  while (pos_ < source_.size()) {
    if (line_start && paren_depth_ == 0) {
      if (!ScanIndentation(&tokens)) continue;
      line_start = false;
    }
    token_line_ = line_;
    token_column_ = column_;
    char c = Peek();
    if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
      Advance();
    } else if (c == '#') {
      while (pos_ < source_.size() && Peek() != '\n') Advance();
    } else if (c == '\\') {
      Advance();
      if (Peek() == '\r') Advance();
      if (Peek() != '\n') Fail("unexpected character after line continuation");
      Advance();
    } else if (c == '\n') {
      Advance();
      if (paren_depth_ == 0) {
        if (!tokens.empty() && tokens.back().type != TokenType::kNewline)
          Emit(&tokens, TokenType::kNewline, "");
        line_start = true;
      }
    } else if (IsNameStart(c)) {
      ScanName(&tokens);
    } else if (isdigit(static_cast<unsigned char>(c)) ||
               (c == '.' && isdigit(static_cast<unsigned char>(Peek(1))))) {
      ScanNumber(&tokens);
    } else if (c == '"' || c == '\'') {
      ScanString("", &tokens);
    } else {
      ScanOperator(&tokens);
    }
  }
  if (paren_depth_ > 0) Fail("unexpected EOF: unclosed bracket");
  token_line_ = line_;
  token_column_ = column_;
  if (!tokens.empty() && tokens.back().type != TokenType::kNewline)
    Emit(&tokens, TokenType::kNewline, "");
  while (indents_.size() > 1) {
    indents_.pop_back();
    Emit(&tokens, TokenType::kDedent, "");
  }
  Emit(&tokens, TokenType::kEnd, "");
  return tokens;
}

bool Lexer::ScanIndentation(std::vector<Token>* tokens) {
  int width = 0;
  while (pos_ < source_.size()) {
    char c = Peek();
    if (c == ' ') {
      width++;
    } else if (c == '\t') {
      width = (width / 8 + 1) * 8;
    } else if (c != '\f') {
      break;
    }
    Advance();
  }
  char c = Peek();
  if (pos_ >= source_.size() || c == '#' || c == '\n' || c == '\r') {
    while (pos_ < source_.size() && Peek() != '\n') Advance();
    if (pos_ < source_.size()) Advance();
    return false;
  }
  token_line_ = line_;
  token_column_ = 1;
  if (width > indents_.back()) {
    if (indents_.size() > kMaxIndentLevels)
      Fail("too many levels of indentation");
    indents_.push_back(width);
    Emit(tokens, TokenType::kIndent, "");
  } else {
    while (width < indents_.back()) {
      indents_.pop_back();
      Emit(tokens, TokenType::kDedent, "");
    }
    if (width != indents_.back())
      Fail("unindent does not match any outer indentation level");
  }
  return true;
}

void Lexer::ScanName(std::vector<Token>* tokens) {
  size_t start = pos_;
  while (pos_ < source_.size() && IsNameChar(Peek())) Advance();
  std::string word = source_.substr(start, pos_ - start);
  if ((Peek() == '"' || Peek() == '\'') && word.size() <= 2) {
    std::string prefix = absl::AsciiStrToLower(word);
    if (prefix == "r" || prefix == "u" || prefix == "f" || prefix == "b" ||
        prefix == "rb" || prefix == "br" || prefix == "fr" || prefix == "rf") {
      ScanString(prefix, tokens);
      return;
    }
  }
  Emit(tokens, IsKeyword(word) ? TokenType::kKeyword : TokenType::kName,
       std::move(word));
}

void Lexer::ScanNumber(std::vector<Token>* tokens) {
  std::string text;
  auto digits = [this, &text](bool (*accept)(char)) {
    while (pos_ < source_.size() && (accept(Peek()) || Peek() == '_')) {
      char c = Advance();
      if (c != '_') text += c;
    }
  };
  auto is_dec = [](char c) { return isdigit(static_cast<unsigned char>(c)) != 0; };
  bool is_float = false;
  char base = Peek(1) | 0x20;
  if (Peek() == '0' && (base == 'x' || base == 'o' || base == 'b')) {
    text += Advance();
    text += static_cast<char>(Advance() | 0x20);
    digits([](char c) { return isxdigit(static_cast<unsigned char>(c)) != 0; });
    if (text.size() == 2) Fail("invalid number literal");
  } else {
    digits(is_dec);
    if (Peek() == '.') {
      is_float = true;
      text += Advance();
      digits(is_dec);
    }
    if ((Peek() | 0x20) == 'e') {
      char sign = Peek(1);
      if (isdigit(static_cast<unsigned char>(sign)) ||
          ((sign == '+' || sign == '-') &&
           isdigit(static_cast<unsigned char>(Peek(2))))) {
        is_float = true;
        text += Advance();
        if (sign == '+' || sign == '-') text += Advance();
        digits(is_dec);
      }
    }
  }
  if ((Peek() | 0x20) == 'j') Fail("complex numbers are not supported");
  if (IsNameChar(Peek())) Fail("invalid number literal");
  Emit(tokens, is_float ? TokenType::kFloat : TokenType::kInt,
       std::move(text));
}

void Lexer::ScanString(const std::string& prefix, std::vector<Token>* tokens) {
  bool raw = prefix.find('r') != std::string::npos;
  bool format = prefix.find('f') != std::string::npos;
  if (prefix.find('b') != std::string::npos)
    Fail("bytes literals are not supported");
  char quote = Advance();
  bool triple = false;
  if (Peek() == quote && Peek(1) == quote) {
    triple = true;
    Advance();
    Advance();
  }
  std::string value;
  while (true) {
    if (pos_ >= source_.size()) Fail("unterminated string literal");
    char c = Peek();
    if (c == quote) {
      if (!triple) {
        Advance();
        break;
      }
      if (Peek(1) == quote && Peek(2) == quote) {
        Advance();
        Advance();
        Advance();
        break;
      }
      value += Advance();
      continue;
    }
    if (c == '\n' && !triple) Fail("unterminated string literal");
    if (c != '\\') {
      value += Advance();
      continue;
    }
    Advance();
    if (pos_ >= source_.size()) Fail("unterminated string literal");
    char e = Advance();
    if (raw) {
      value += '\\';
      value += e;
      continue;
    }
    switch (e) {
      case '\n':
        break;
      case 'n':
        value += '\n';
        break;
      case 't':
        value += '\t';
        break;
      case 'r':
        value += '\r';
        break;
      case '\\':
        value += '\\';
        break;
      case '\'':
        value += '\'';
        break;
      case '"':
        value += '"';
        break;
      case 'a':
        value += '\a';
        break;
      case 'b':
        value += '\b';
        break;
      case 'f':
        value += '\f';
        break;
      case 'v':
        value += '\v';
        break;
      case 'x':
      case 'u':
      case 'U': {
        int len = e == 'x' ? 2 : e == 'u' ? 4 : 8;
        uint32_t cp = 0;
        for (int i = 0; i < len; i++) {
          char h = Peek();
          if (!isxdigit(static_cast<unsigned char>(h)))
            Fail("truncated escape sequence");
          Advance();
          cp = cp * 16 + (isdigit(static_cast<unsigned char>(h))
                              ? h - '0'
                              : (h | 0x20) - 'a' + 10);
        }
        if (cp > 0x10ffff) Fail("illegal Unicode character");
        AppendUtf8(cp, &value);
        break;
      }
      default:
        if (e >= '0' && e <= '7') {
          uint32_t cp = e - '0';
          for (int i = 0; i < 2 && Peek() >= '0' && Peek() <= '7'; i++)
            cp = cp * 8 + (Advance() - '0');
          AppendUtf8(cp, &value);
        } else {
          value += '\\';
          value += e;
        }
    }
  }
  Emit(tokens, format ? TokenType::kFString : TokenType::kString,
       std::move(value));
}

void Lexer::ScanOperator(std::vector<Token>* tokens) {
  static const char* const kThree[] = {"**=", "//=", ">>=", "<<=", "..."};
  static const char* const kTwo[] = {"**", "//", "==", "!=", "<=", ">=",
                                     "<<", ">>", "+=", "-=", "*=", "/=",
                                     "%=", "&=", "|=", "^=", "->", ":="};
  for (const char* op : kThree) {
    if (source_.compare(pos_, 3, op) == 0) {
      Advance();
      Advance();
      Advance();
      Emit(tokens, TokenType::kOp, op);
      return;
    }
  }
  for (const char* op : kTwo) {
    if (source_.compare(pos_, 2, op) == 0) {
      Advance();
      Advance();
      Emit(tokens, TokenType::kOp, op);
      return;
    }
  }
  char c = Peek();
  if (std::string("+-*/%&|^~<>()[]{},:.;@=").find(c) == std::string::npos)
    Fail(std::string("invalid character '") + c + "'");
  if (c == '(' || c == '[' || c == '{') paren_depth_++;
  if (c == ')' || c == ']' || c == '}') {
    if (paren_depth_ == 0) Fail(std::string("unmatched '") + c + "'");
    paren_depth_--;
  }
  Advance();
  Emit(tokens, TokenType::kOp, std::string(1, c));
}

}  // namespace script
