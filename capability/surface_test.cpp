#include "capability/surface.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "script/parser.hpp"

namespace {

using ::testing::_;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::Return;
using ::testing::Throw;

class MockDatabase : public capability::Database {
 public:
  MOCK_METHOD2(Query, std::vector<proto::Row>(const std::string&,
                                               const proto::ValueDict&));
  MOCK_METHOD0(Tables, std::vector<std::string>());
  MOCK_METHOD1(Schema, std::vector<proto::Row>(const std::string&));
};

class SurfaceTest : public ::testing::Test {
 protected:
  SurfaceTest() : config_(policy::SandboxConfig::Default()), out_(1000) {}

  // Runs source with a freshly installed surface and returns what it
  // printed, or "Type: message" if it raised.
  std::string Run(const std::string& source,
                  capability::Database* database = nullptr) {
    capability::CapabilitySurface surface(config_, &out_, &debugger_,
                                          database);
    script::Interpreter interpreter;
    surface.Install(&interpreter);
    try {
      interpreter.Run(script::Parse(source));
    } catch (const script::ScriptError& e) {
      return e.what();
    }
    return out_.contents();
  }

  policy::SandboxConfig config_;
  capability::OutputBuffer out_;
  debugger::Debugger debugger_;
};

TEST_F(SurfaceTest, Names) {
  capability::CapabilitySurface surface(config_, &out_, &debugger_, nullptr);
  std::set<std::string> names = surface.Names();
  for (const char* name :
       {"len", "str", "int", "float", "bool", "list", "dict", "tuple",
        "range", "enumerate", "zip", "map", "filter", "sorted", "reversed",
        "min", "max", "sum", "abs", "round", "pow", "divmod", "isinstance",
        "type", "repr", "chr", "ord", "hex", "oct", "bin", "any", "all",
        "print", "debug", "inspect_var", "get_debug_info", "Exception",
        "ValueError", "TypeError", "KeyError", "IndexError",
        "ZeroDivisionError", "RuntimeError"}) {
    EXPECT_THAT(names, Contains(name));
  }
  EXPECT_THAT(names, Not(Contains("db_query")));
  EXPECT_THAT(names, Not(Contains("open")));
  EXPECT_THAT(surface.Modules(),
              ::testing::ElementsAre("json", "math", "random", "string"));
}

TEST_F(SurfaceTest, BlockedCallablesAreNotInstalled) {
  config_.blocked_callables.insert("sorted");
  config_.enable_debugging = false;
  capability::CapabilitySurface surface(config_, &out_, &debugger_, nullptr);
  EXPECT_THAT(surface.Names(), Not(Contains("sorted")));
  EXPECT_THAT(surface.Names(), Not(Contains("debug")));
  EXPECT_THAT(Run("sorted([2, 1])\n"),
              HasSubstr("name 'sorted' is not defined"));
}

TEST_F(SurfaceTest, ModulesFollowPolicy) {
  config_.allowed_modules = {"math"};
  capability::CapabilitySurface surface(config_, &out_, &debugger_, nullptr);
  EXPECT_THAT(surface.Modules(), ::testing::ElementsAre("math"));
  EXPECT_THAT(Run("import json\n"), HasSubstr("No module named 'json'"));
}

TEST_F(SurfaceTest, Print) {
  EXPECT_EQ(Run("print('a', 1, [2.5], None, sep='-', end='!')\nprint()\n"),
            "a-1-[2.5]-None!\n");
}

TEST_F(SurfaceTest, OutputIsCapped) {
  EXPECT_EQ(Run("for i in range(1000):\n    print('0123456789')\n").size(),
            1000);
  EXPECT_TRUE(out_.truncated());
}

TEST_F(SurfaceTest, Conversions) {
  EXPECT_EQ(Run("print(int('  -42 '), int('ff', 16), int('0b101', 0), "
                "int(3.9), float('1e3'), str(12), bool([]), "
                "list('ab'), tuple([1]), dict([('a', 1)], b=2))\n"),
            "-42 255 5 3 1000.0 12 False ['a', 'b'] (1,) {'a': 1, 'b': 2}\n");
  EXPECT_THAT(Run("int('x1')\n"),
              HasSubstr("invalid literal for int() with base 10: 'x1'"));
  EXPECT_THAT(Run("float('abc')\n"), HasSubstr("ValueError"));
}

TEST_F(SurfaceTest, IterationHelpers) {
  EXPECT_EQ(Run("print(list(enumerate('ab', 1)), list(zip([1, 2, 3], 'xy')), "
                "list(map(lambda a, b: a + b, [1, 2], [10, 20])), "
                "list(filter(None, [0, 1, '', 'a'])), "
                "sorted([3, 1, 2], reverse=True), "
                "sorted(['bb', 'a', 'ccc'], key=len), list(reversed(range(3))))\n"),
            "[(1, 'a'), (2, 'b')] [(1, 'x'), (2, 'y')] [11, 22] [1, 'a'] "
            "[3, 2, 1] ['a', 'bb', 'ccc'] [2, 1, 0]\n");
}

TEST_F(SurfaceTest, Arithmetic) {
  EXPECT_EQ(Run("print(min(3, 1, 2), max([1, 5, 2]), max([], default=0), "
                "min(['aa', 'b'], key=len), sum([1, 2, 3]), sum([0.5], 1), "
                "abs(-3), round(2.5), round(3.5), round(2.675, 2), "
                "round(1250, -2), pow(2, 10), pow(3, 4, 5), divmod(-7, 2))\n"),
            "1 5 0 b 6 1.5 3 2 4 2.67 1200 1024 1 (-4, 1)\n");
  EXPECT_THAT(Run("max([])\n"), HasSubstr("empty sequence"));
  EXPECT_THAT(Run("sum(['a'], '')\n"), HasSubstr("can't sum strings"));
}

TEST_F(SurfaceTest, Introspection) {
  EXPECT_EQ(Run("print(isinstance(True, int), isinstance(1, (str, float)), "
                "type(1) == int, type('x')('y'), repr('q'), chr(233), "
                "ord('é'), hex(255), oct(8), bin(-5), any([0, 2]), all([]), "
                "isinstance(ValueError('x'), Exception), len('héllo'))\n"),
            "True False True y 'q' é 233 0xff 0o10 -0b101 True True True 5\n");
}

TEST_F(SurfaceTest, MathModule) {
  EXPECT_EQ(Run("import math\nprint(math.sqrt(16), math.floor(-1.5), "
                "math.factorial(5), math.gcd(12, 18), math.isclose(0.1 + 0.2, "
                "0.3), round(math.pi, 3), math.log(8, 2))\n"),
            "4.0 -2 120 6 True 3.142 3.0\n");
  EXPECT_THAT(Run("import math\nmath.sqrt(-1)\n"),
              HasSubstr("ValueError: math domain error"));
}

TEST_F(SurfaceTest, JsonModule) {
  EXPECT_EQ(Run("import json\nd = json.loads('{\"a\": [1, 2.5, null, true]}')\n"
                "print(d, json.dumps([1, 'x', None]))\n"),
            "{'a': [1, 2.5, None, True]} [1, \"x\", null]\n");
  EXPECT_THAT(Run("import json\njson.loads('{')\n"), HasSubstr("ValueError"));
  EXPECT_THAT(Run("import json\njson.dumps(len)\n"),
              HasSubstr("is not JSON serializable"));
}

TEST_F(SurfaceTest, JsonKeepsOrderAndNumberTypes) {
  EXPECT_EQ(Run("import json\n"
                "d = json.loads('{\"b\": 1, \"a\": 2.0, \"n\": 9007199254740993}')\n"
                "print(d)\n"
                "print(json.dumps(d))\n"
                "print(json.dumps(d, sort_keys=True))\n"),
            "{'b': 1, 'a': 2.0, 'n': 9007199254740993}\n"
            "{\"b\": 1, \"a\": 2.0, \"n\": 9007199254740993}\n"
            "{\"a\": 2.0, \"b\": 1, \"n\": 9007199254740993}\n");
  EXPECT_EQ(Run("import json\n"
                "print(json.dumps([1, {'x': '\u00e9'}, []], indent=2))\n"
                "print(json.dumps('\u00e9', ensure_ascii=False))\n"),
            "[\n  1,\n  {\n    \"x\": \"\\u00e9\"\n  },\n  []\n]\n"
            "\"\u00e9\"\n");
}

TEST_F(SurfaceTest, RandomModule) {
  EXPECT_EQ(Run("import random\nrandom.seed(7)\na = random.randint(1, 6)\n"
                "random.seed(7)\nb = random.randint(1, 6)\n"
                "l = [1, 2, 3]\nrandom.shuffle(l)\n"
                "print(a == b, 1 <= a <= 6, sorted(l), "
                "random.choice(['only']), len(random.sample(range(10), 3)))\n"),
            "True True [1, 2, 3] only 3\n");
}

TEST_F(SurfaceTest, StringModule) {
  EXPECT_EQ(Run("from string import ascii_lowercase, digits, capwords\n"
                "print(ascii_lowercase[:3], digits[-1], capwords('hello  WORLD'))\n"),
            "abc 9 Hello World\n");
}

TEST_F(SurfaceTest, DebugHelpers) {
  EXPECT_EQ(Run("def f(x):\n"
                "    debug('in f', 'warning', data={'x': x})\n"
                "f(3)\n"
                "inspect_var('y', [1, 2])\n"
                "info = get_debug_info()\n"
                "print(info['total_events'], info['levels']['WARNING'], "
                "info['variables'])\n"),
            "1 1 ['y']\n");
  proto::DebugSummary summary = debugger_.Summary();
  ASSERT_EQ(summary.recent_event_size(), 1);
  const proto::DebugEvent& event = summary.recent_event(0);
  EXPECT_EQ(event.level(), proto::LEVEL_WARNING);
  EXPECT_EQ(event.data(), "{'x': 3}");
  EXPECT_EQ(event.frame().function(), "f");
  EXPECT_EQ(event.frame().line(), 2);
  EXPECT_EQ(event.frame().locals().at("x"), "3");
  EXPECT_EQ(debugger_.History("y")[0].repr(), "[1, 2]");
}

TEST_F(SurfaceTest, DatabaseHelpers) {
  MockDatabase database;
  proto::Row row;
  row.add_column("id");
  row.add_value()->set_int_value(1);
  EXPECT_CALL(database, Query("SELECT id FROM t WHERE a = :a", _))
      .WillOnce(Return(std::vector<proto::Row>{row}));
  EXPECT_CALL(database, Tables())
      .WillOnce(Return(std::vector<std::string>{"t"}));
  EXPECT_EQ(Run("print(db_query('SELECT id FROM t WHERE a = :a', {'a': 1}), "
                "db_tables())\n",
                &database),
            "[{'id': 1}] ['t']\n");
}

TEST_F(SurfaceTest, DatabaseErrorsAreRuntimeErrors) {
  MockDatabase database;
  EXPECT_CALL(database, Schema("missing"))
      .WillOnce(Throw(capability::database_error("no such table")));
  EXPECT_EQ(Run("try:\n"
                "    db_schema('missing')\n"
                "except RuntimeError as e:\n"
                "    print('caught', e)\n",
                &database),
            "caught database error: no such table\n");
}

}  // namespace
