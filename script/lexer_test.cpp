#include "script/lexer.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "script/errors.hpp"

namespace {

using script::Lexer;
using script::SyntaxError;
using script::Token;
using script::TokenType;

std::vector<TokenType> Types(const std::string& source) {
  std::vector<TokenType> types;
  for (const Token& token : Lexer(source).Tokenize()) types.push_back(token.type);
  return types;
}

TEST(LexerTest, IndentAndDedent) {
  std::vector<TokenType> expected = {
      TokenType::kKeyword, TokenType::kName,    TokenType::kOp,
      TokenType::kNewline, TokenType::kIndent,  TokenType::kKeyword,
      TokenType::kNewline, TokenType::kDedent,  TokenType::kName,
      TokenType::kNewline, TokenType::kEnd};
  EXPECT_EQ(Types("if x:\n    pass\ny\n"), expected);
}

TEST(LexerTest, BlankLinesAndCommentsAreSkipped) {
  std::vector<TokenType> expected = {TokenType::kName, TokenType::kNewline,
                                     TokenType::kName, TokenType::kNewline,
                                     TokenType::kEnd};
  EXPECT_EQ(Types("a\n\n   # comment\n\nb  # trailing\n"), expected);
}

TEST(LexerTest, NewlinesInsideBracketsAreIgnored) {
  std::vector<Token> tokens = Lexer("f(1,\n  2)\n").Tokenize();
  ASSERT_EQ(tokens.size(), 8);
  EXPECT_EQ(tokens[4].text, "2");
  EXPECT_EQ(tokens[4].line, 2);
  EXPECT_EQ(tokens[6].type, TokenType::kNewline);
}

TEST(LexerTest, StringEscapes) {
  std::vector<Token> tokens =
      Lexer(R"(s = 'a\tb\n\x41\u00e9' + r'\n')").Tokenize();
  ASSERT_GE(tokens.size(), 5);
  EXPECT_EQ(tokens[2].type, TokenType::kString);
  EXPECT_EQ(tokens[2].text, "a\tb\nA\xc3\xa9");
  EXPECT_EQ(tokens[4].text, "\\n");
}

TEST(LexerTest, TripleQuotedString) {
  std::vector<Token> tokens = Lexer("x = \"\"\"one\ntwo\"\"\"\ny").Tokenize();
  EXPECT_EQ(tokens[2].text, "one\ntwo");
  EXPECT_EQ(tokens[4].text, "y");
  EXPECT_EQ(tokens[4].line, 3);
}

TEST(LexerTest, FStringToken) {
  std::vector<Token> tokens = Lexer("f'{x}!'").Tokenize();
  EXPECT_EQ(tokens[0].type, TokenType::kFString);
  EXPECT_EQ(tokens[0].text, "{x}!");
}

TEST(LexerTest, Numbers) {
  std::vector<Token> tokens = Lexer("1_000 0xff 1.5e3 .5").Tokenize();
  EXPECT_EQ(tokens[0].type, TokenType::kInt);
  EXPECT_EQ(tokens[0].text, "1000");
  EXPECT_EQ(tokens[1].type, TokenType::kInt);
  EXPECT_EQ(tokens[2].type, TokenType::kFloat);
  EXPECT_EQ(tokens[3].type, TokenType::kFloat);
}

TEST(LexerTest, Operators) {
  std::vector<Token> tokens = Lexer("a //= b ** c != d").Tokenize();
  EXPECT_EQ(tokens[1].text, "//=");
  EXPECT_EQ(tokens[3].text, "**");
  EXPECT_EQ(tokens[5].text, "!=");
}

TEST(LexerTest, Errors) {
  EXPECT_THROW(Lexer("x = 'abc").Tokenize(), SyntaxError);
  EXPECT_THROW(Lexer("f(1, 2").Tokenize(), SyntaxError);
  EXPECT_THROW(Lexer("x = b'abc'").Tokenize(), SyntaxError);
  EXPECT_THROW(Lexer("if x:\n    a\n  b\n").Tokenize(), SyntaxError);
  EXPECT_THROW(Lexer("x = $").Tokenize(), SyntaxError);
}

TEST(LexerTest, ErrorPosition) {
  try {
    Lexer("a = 1\nb = 'open\n").Tokenize();
    FAIL() << "expected a SyntaxError";
  } catch (const SyntaxError& e) {
    EXPECT_EQ(e.line(), 2);
  }
}

}  // namespace
