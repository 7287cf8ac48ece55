#include "script/parser.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "script/errors.hpp"

namespace {

using ::testing::HasSubstr;
using script::Parse;
using script::SyntaxError;
namespace ast = script::ast;

std::string SyntaxErrorOf(const std::string& source) {
  try {
    Parse(source);
  } catch (const SyntaxError& e) {
    return e.what();
  }
  return "";
}

TEST(ParserTest, AssignmentChain) {
  auto module = Parse("a = b = 1 + 2 * 3\n");
  ASSERT_EQ(module->body.size(), 1);
  ASSERT_EQ(module->body[0]->kind, ast::StmtKind::kAssign);
  const auto& assign = static_cast<const ast::Assign&>(*module->body[0]);
  EXPECT_EQ(assign.targets.size(), 2);
  ASSERT_EQ(assign.value->kind, ast::ExprKind::kBinary);
  const auto& sum = static_cast<const ast::Binary&>(*assign.value);
  EXPECT_EQ(sum.op, ast::BinOp::kAdd);
  EXPECT_EQ(sum.right->kind, ast::ExprKind::kBinary);
}

TEST(ParserTest, PowerBindsTighterThanUnaryMinus) {
  auto module = Parse("x = -2 ** 2\n");
  const auto& assign = static_cast<const ast::Assign&>(*module->body[0]);
  ASSERT_EQ(assign.value->kind, ast::ExprKind::kUnary);
  const auto& neg = static_cast<const ast::Unary&>(*assign.value);
  EXPECT_EQ(neg.operand->kind, ast::ExprKind::kBinary);
}

TEST(ParserTest, CompoundStatements) {
  auto module = Parse(
      "def f(a, b=2, *args, **kwargs):\n"
      "    for i in range(a):\n"
      "        if i % 2:\n"
      "            continue\n"
      "        elif i > 5:\n"
      "            break\n"
      "    else:\n"
      "        pass\n"
      "    try:\n"
      "        return a\n"
      "    except (ValueError, KeyError) as e:\n"
      "        raise\n"
      "    finally:\n"
      "        b = 1\n");
  ASSERT_EQ(module->body.size(), 1);
  const auto& def = static_cast<const ast::FunctionDef&>(*module->body[0]);
  EXPECT_EQ(def.name, "f");
  EXPECT_EQ(def.signature.params.size(), 2);
  EXPECT_EQ(def.signature.vararg, "args");
  EXPECT_EQ(def.signature.kwarg, "kwargs");
  ASSERT_EQ(def.body.size(), 2);
  EXPECT_EQ(def.body[0]->kind, ast::StmtKind::kFor);
  const auto& try_stmt = static_cast<const ast::Try&>(*def.body[1]);
  ASSERT_EQ(try_stmt.handlers.size(), 1);
  EXPECT_EQ(try_stmt.handlers[0].name, "e");
  EXPECT_EQ(try_stmt.finalbody.size(), 1);
}

TEST(ParserTest, Comprehensions) {
  auto module = Parse(
      "a = [x * y for x in range(3) for y in range(x) if y]\n"
      "b = {k: v for k, v in items}\n"
      "c = sum(x for x in a)\n");
  const auto& a = static_cast<const ast::Assign&>(*module->body[0]);
  ASSERT_EQ(a.value->kind, ast::ExprKind::kListComp);
  EXPECT_EQ(static_cast<const ast::Comp&>(*a.value).generators.size(), 2);
  const auto& b = static_cast<const ast::Assign&>(*module->body[1]);
  EXPECT_EQ(b.value->kind, ast::ExprKind::kDictComp);
  const auto& c = static_cast<const ast::Assign&>(*module->body[2]);
  const auto& call = static_cast<const ast::Call&>(*c.value);
  ASSERT_EQ(call.args.size(), 1);
  EXPECT_EQ(call.args[0]->kind, ast::ExprKind::kListComp);
}

TEST(ParserTest, SubscriptsAndSlices) {
  auto module = Parse("x = a[1:2], a[::-1], a[i]\n");
  const auto& assign = static_cast<const ast::Assign&>(*module->body[0]);
  const auto& tuple = static_cast<const ast::Sequence&>(*assign.value);
  ASSERT_EQ(tuple.elts.size(), 3);
  const auto& first = static_cast<const ast::Subscript&>(*tuple.elts[0]);
  EXPECT_EQ(first.index->kind, ast::ExprKind::kSlice);
  const auto& third = static_cast<const ast::Subscript&>(*tuple.elts[2]);
  EXPECT_EQ(third.index->kind, ast::ExprKind::kName);
}

TEST(ParserTest, FStringFields) {
  auto module = Parse("s = f'a{x!r:>5}b{y=}{{c}}'\n");
  const auto& assign = static_cast<const ast::Assign&>(*module->body[0]);
  ASSERT_EQ(assign.value->kind, ast::ExprKind::kFString);
  const auto& fstring = static_cast<const ast::FString&>(*assign.value);
  ASSERT_EQ(fstring.parts.size(), 5);
  EXPECT_EQ(fstring.parts[0].literal, "a");
  EXPECT_FALSE(fstring.parts[0].value);
  ASSERT_TRUE(fstring.parts[1].value);
  EXPECT_EQ(fstring.parts[1].conversion, 'r');
  EXPECT_EQ(fstring.parts[1].spec, ">5");
  EXPECT_EQ(fstring.parts[2].literal, "by=");
  EXPECT_EQ(fstring.parts[3].conversion, 'r');
  EXPECT_EQ(fstring.parts[4].literal, "{c}");
  EXPECT_FALSE(fstring.parts[4].value);
}

TEST(ParserTest, Imports) {
  auto module = Parse("import math, json as j\nfrom string import ascii_letters\n");
  const auto& import = static_cast<const ast::Import&>(*module->body[0]);
  ASSERT_EQ(import.names.size(), 2);
  EXPECT_EQ(import.names[1].asname, "j");
  const auto& from = static_cast<const ast::ImportFrom&>(*module->body[1]);
  EXPECT_EQ(from.module, "string");
}

TEST(ParserTest, UnsupportedSyntax) {
  EXPECT_THAT(SyntaxErrorOf("class A:\n    pass\n"), HasSubstr("not supported"));
  EXPECT_THAT(SyntaxErrorOf("with f() as g:\n    pass\n"),
              HasSubstr("not supported"));
  EXPECT_THAT(SyntaxErrorOf("s = {1, 2}\n"), HasSubstr("not supported"));
  EXPECT_THAT(SyntaxErrorOf("def f():\n    yield 1\n"),
              HasSubstr("not supported"));
  EXPECT_THAT(SyntaxErrorOf("from . import x\n"), HasSubstr("not supported"));
}

TEST(ParserTest, InvalidSyntax) {
  EXPECT_NE(SyntaxErrorOf("x = = 1\n"), "");
  EXPECT_NE(SyntaxErrorOf("1 = x\n"), "");
  EXPECT_NE(SyntaxErrorOf("def f(:\n"), "");
  EXPECT_NE(SyntaxErrorOf("if x\n    pass\n"), "");
  EXPECT_NE(SyntaxErrorOf("x = 0123\n"), "");
  EXPECT_NE(SyntaxErrorOf("x = 99999999999999999999\n"), "");
  EXPECT_THAT(SyntaxErrorOf("break\n"), HasSubstr("outside loop"));
  EXPECT_THAT(SyntaxErrorOf("return 1\n"), HasSubstr("outside function"));
  EXPECT_THAT(SyntaxErrorOf("f(a=1, b)\n"),
              HasSubstr("positional argument follows keyword argument"));
}

TEST(ParserTest, NestingLimit) {
  std::string deep = "x = " + std::string(150, '(') + "1" +
                     std::string(150, ')') + "\n";
  EXPECT_THAT(SyntaxErrorOf(deep), HasSubstr("too many nested"));
}

TEST(ParserTest, ErrorLine) {
  try {
    Parse("a = 1\nb = (\n  2 +\n)\n");
    FAIL() << "expected a SyntaxError";
  } catch (const SyntaxError& e) {
    EXPECT_EQ(e.line(), 4);
  }
}

}  // namespace
