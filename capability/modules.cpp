#include "capability/modules.hpp"

#include <math.h>
#include <stdint.h>

#include <algorithm>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "nlohmann/json.hpp"

namespace capability {

namespace {

using script::CallArgs;
using script::Interpreter;
using script::ScriptError;
using script::Value;

ScriptError ValueError(const std::string& msg) {
  return ScriptError("ValueError", msg);
}

double Number(const CallArgs& args, size_t position, const char* function) {
  const Value* value = args.Get(position, nullptr);
  if (!value || !value->is_number())
    throw ScriptError("TypeError",
                      absl::StrCat(function, "() argument must be a number"));
  return value->AsDouble();
}

int64_t Integer(const CallArgs& args, size_t position, const char* function) {
  const Value* value = args.Get(position, nullptr);
  if (!value || !(value->is_int() || value->is_bool()))
    throw ScriptError("TypeError",
                      absl::StrCat(function, "() argument must be an integer"));
  return value->int_value();
}

Value Checked(double result) {
  if (isinf(result)) throw ScriptError("OverflowError", "math range error");
  if (isnan(result)) throw ValueError("math domain error");
  return Value::Float(result);
}

class ModuleBuilder {
 public:
  explicit ModuleBuilder(const std::string& name)
      : module_(std::make_shared<script::ModuleObject>(name)) {}

  ModuleBuilder& Function(const std::string& name, script::NativeFn fn) {
    module_->attributes[name] = script::MakeNative(name, std::move(fn));
    return *this;
  }

  // A function of one float returning a float, with domain checks.
  ModuleBuilder& Unary(const std::string& name, double (*fn)(double)) {
    std::string function = name;
    return Function(name, [fn, function](Interpreter*, CallArgs* args) {
      args->Check(function.c_str(), 1, 1);
      double x = Number(*args, 0, function.c_str());
      if (isinf(x) || isnan(x)) return Value::Float(fn(x));
      return Checked(fn(x));
    });
  }

  ModuleBuilder& Constant(const std::string& name, Value value) {
    module_->attributes[name] = std::move(value);
    return *this;
  }

  Value Build() { return Value::FromObject(script::Type::kModule, module_); }

 private:
  std::shared_ptr<script::ModuleObject> module_;
};

// Rounding functions return ints.
Value ToIntegral(double x, const char* function) {
  if (isnan(x)) throw ValueError("cannot convert float NaN to integer");
  if (isinf(x))
    throw ScriptError("OverflowError",
                      "cannot convert float infinity to integer");
  if (x < -9223372036854775808.0 || x >= 9223372036854775808.0)
    throw ScriptError("OverflowError", absl::StrCat(function, "(): integer overflow"));
  return Value::Int(static_cast<int64_t>(x));
}

int64_t Gcd(int64_t a, int64_t b) {
  uint64_t x = a < 0 ? 0 - static_cast<uint64_t>(a) : a;
  uint64_t y = b < 0 ? 0 - static_cast<uint64_t>(b) : b;
  while (y) {
    uint64_t t = x % y;
    x = y;
    y = t;
  }
  if (x > static_cast<uint64_t>(INT64_MAX))
    throw ScriptError("OverflowError", "integer overflow");
  return static_cast<int64_t>(x);
}

Value MathModule(Interpreter*) {
  ModuleBuilder math("math");
  math.Constant("pi", Value::Float(M_PI))
      .Constant("e", Value::Float(M_E))
      .Constant("tau", Value::Float(2 * M_PI))
      .Constant("inf", Value::Float(HUGE_VAL))
      .Constant("nan", Value::Float(NAN))
      .Unary("exp", ::exp)
      .Unary("log2", ::log2)
      .Unary("log10", ::log10)
      .Unary("sin", ::sin)
      .Unary("cos", ::cos)
      .Unary("tan", ::tan)
      .Unary("asin", ::asin)
      .Unary("acos", ::acos)
      .Unary("atan", ::atan)
      .Unary("sinh", ::sinh)
      .Unary("cosh", ::cosh)
      .Unary("tanh", ::tanh)
      .Unary("fabs", ::fabs);
  math.Function("sqrt", [](Interpreter*, CallArgs* args) {
    args->Check("sqrt", 1, 1);
    double x = Number(*args, 0, "sqrt");
    if (x < 0) throw ValueError("math domain error");
    return Value::Float(sqrt(x));
  });
  math.Function("log", [](Interpreter*, CallArgs* args) {
    args->Check("log", 1, 2);
    double x = Number(*args, 0, "log");
    if (x <= 0) throw ValueError("math domain error");
    if (args->args.size() == 1) return Value::Float(::log(x));
    double base = Number(*args, 1, "log");
    if (base <= 0 || base == 1) throw ValueError("math domain error");
    return Value::Float(::log(x) / ::log(base));
  });
  math.Function("pow", [](Interpreter*, CallArgs* args) {
    args->Check("pow", 2, 2);
    return Checked(::pow(Number(*args, 0, "pow"), Number(*args, 1, "pow")));
  });
  math.Function("atan2", [](Interpreter*, CallArgs* args) {
    args->Check("atan2", 2, 2);
    return Value::Float(::atan2(Number(*args, 0, "atan2"),
                                Number(*args, 1, "atan2")));
  });
  math.Function("hypot", [](Interpreter*, CallArgs* args) {
    double sum = 0;
    for (size_t i = 0; i < args->args.size(); i++) {
      double x = Number(*args, i, "hypot");
      sum += x * x;
    }
    return Value::Float(sqrt(sum));
  });
  math.Function("fmod", [](Interpreter*, CallArgs* args) {
    args->Check("fmod", 2, 2);
    double y = Number(*args, 1, "fmod");
    if (y == 0) throw ValueError("math domain error");
    return Value::Float(::fmod(Number(*args, 0, "fmod"), y));
  });
  math.Function("copysign", [](Interpreter*, CallArgs* args) {
    args->Check("copysign", 2, 2);
    return Value::Float(::copysign(Number(*args, 0, "copysign"),
                                   Number(*args, 1, "copysign")));
  });
  math.Function("degrees", [](Interpreter*, CallArgs* args) {
    args->Check("degrees", 1, 1);
    return Value::Float(Number(*args, 0, "degrees") * 180.0 / M_PI);
  });
  math.Function("radians", [](Interpreter*, CallArgs* args) {
    args->Check("radians", 1, 1);
    return Value::Float(Number(*args, 0, "radians") * M_PI / 180.0);
  });
  math.Function("floor", [](Interpreter*, CallArgs* args) {
    args->Check("floor", 1, 1);
    const Value& x = args->args[0];
    if (x.is_int() || x.is_bool()) return Value::Int(x.int_value());
    return ToIntegral(::floor(Number(*args, 0, "floor")), "floor");
  });
  math.Function("ceil", [](Interpreter*, CallArgs* args) {
    args->Check("ceil", 1, 1);
    const Value& x = args->args[0];
    if (x.is_int() || x.is_bool()) return Value::Int(x.int_value());
    return ToIntegral(::ceil(Number(*args, 0, "ceil")), "ceil");
  });
  math.Function("trunc", [](Interpreter*, CallArgs* args) {
    args->Check("trunc", 1, 1);
    const Value& x = args->args[0];
    if (x.is_int() || x.is_bool()) return Value::Int(x.int_value());
    return ToIntegral(::trunc(Number(*args, 0, "trunc")), "trunc");
  });
  math.Function("isfinite", [](Interpreter*, CallArgs* args) {
    args->Check("isfinite", 1, 1);
    return Value::Bool(isfinite(Number(*args, 0, "isfinite")));
  });
  math.Function("isinf", [](Interpreter*, CallArgs* args) {
    args->Check("isinf", 1, 1);
    return Value::Bool(isinf(Number(*args, 0, "isinf")));
  });
  math.Function("isnan", [](Interpreter*, CallArgs* args) {
    args->Check("isnan", 1, 1);
    return Value::Bool(isnan(Number(*args, 0, "isnan")));
  });
  math.Function("isclose", [](Interpreter*, CallArgs* args) {
    args->Check("isclose", 2, 2, {"rel_tol", "abs_tol"});
    double a = Number(*args, 0, "isclose");
    double b = Number(*args, 1, "isclose");
    const Value* rel = args->Get(SIZE_MAX, "rel_tol");
    const Value* abs_tol = args->Get(SIZE_MAX, "abs_tol");
    double rel_tol = rel && rel->is_number() ? rel->AsDouble() : 1e-9;
    double abs_value = abs_tol && abs_tol->is_number() ? abs_tol->AsDouble() : 0;
    if (a == b) return Value::Bool(true);
    if (isinf(a) || isinf(b)) return Value::Bool(false);
    double diff = fabs(b - a);
    return Value::Bool(diff <= fabs(rel_tol * b) || diff <= fabs(rel_tol * a) ||
                       diff <= abs_value);
  });
  math.Function("factorial", [](Interpreter* interpreter, CallArgs* args) {
    args->Check("factorial", 1, 1);
    int64_t n = Integer(*args, 0, "factorial");
    if (n < 0) throw ValueError("factorial() not defined for negative values");
    int64_t result = 1;
    for (int64_t i = 2; i <= n; i++) {
      interpreter->CheckInterrupt();
      if (__builtin_mul_overflow(result, i, &result))
        throw ScriptError("OverflowError", "integer overflow");
    }
    return Value::Int(result);
  });
  math.Function("gcd", [](Interpreter*, CallArgs* args) {
    int64_t result = 0;
    for (size_t i = 0; i < args->args.size(); i++)
      result = Gcd(result, Integer(*args, i, "gcd"));
    return Value::Int(result);
  });
  math.Function("lcm", [](Interpreter*, CallArgs* args) {
    int64_t result = 1;
    for (size_t i = 0; i < args->args.size(); i++) {
      int64_t x = Integer(*args, i, "lcm");
      if (x == 0 || result == 0) {
        result = 0;
        continue;
      }
      int64_t step = x / Gcd(result, x);
      if (__builtin_mul_overflow(result, step, &result))
        throw ScriptError("OverflowError", "integer overflow");
      if (result < 0) result = -result;
    }
    return Value::Int(result);
  });
  math.Function("comb", [](Interpreter*, CallArgs* args) {
    args->Check("comb", 2, 2);
    int64_t n = Integer(*args, 0, "comb");
    int64_t k = Integer(*args, 1, "comb");
    if (n < 0 || k < 0) throw ValueError("comb() arguments must be non-negative");
    if (k > n) return Value::Int(0);
    k = std::min(k, n - k);
    __int128 result = 1;
    for (int64_t i = 1; i <= k; i++) {
      result = result * (n - k + i) / i;
      if (result > INT64_MAX)
        throw ScriptError("OverflowError", "integer overflow");
    }
    return Value::Int(static_cast<int64_t>(result));
  });
  math.Function("fsum", [](Interpreter* interpreter, CallArgs* args) {
    args->Check("fsum", 1, 1);
    // Kahan summation.
    double sum = 0;
    double compensation = 0;
    interpreter->ForEach(args->args[0], [&](const Value& item) {
      if (!item.is_number())
        throw ScriptError("TypeError", "must be real number, not " +
                                           script::TypeName(item));
      double y = item.AsDouble() - compensation;
      double t = sum + y;
      compensation = (t - sum) - y;
      sum = t;
      return true;
    });
    return Value::Float(sum);
  });
  math.Function("prod", [](Interpreter* interpreter, CallArgs* args) {
    args->Check("prod", 1, 1, {"start"});
    const Value* start = args->Get(SIZE_MAX, "start");
    Value result = start ? *start : Value::Int(1);
    interpreter->ForEach(args->args[0], [&](const Value& item) {
      result = interpreter->BinaryOp(script::ast::BinOp::kMul, result, item);
      return true;
    });
    return result;
  });
  return math.Build();
}

// Python's json module on top of nlohmann::ordered_json, which keeps the
// key order and tells ints from floats.
using Json = nlohmann::ordered_json;

static const constexpr int kMaxJsonDepth = 100;

bool ToJson(const Value& value, Json* out, int depth, std::string* error) {
  if (depth > kMaxJsonDepth) {
    *error = "maximum recursion depth exceeded while encoding a JSON object";
    return false;
  }
  switch (value.type()) {
    case script::Type::kNone:
      *out = nullptr;
      return true;
    case script::Type::kBool:
      *out = value.bool_value();
      return true;
    case script::Type::kInt:
      *out = value.int_value();
      return true;
    case script::Type::kFloat:
      if (!isfinite(value.float_value())) {
        *error = "Out of range float values are not JSON compliant";
        return false;
      }
      *out = value.float_value();
      return true;
    case script::Type::kStr:
      *out = value.str();
      return true;
    case script::Type::kList:
    case script::Type::kTuple:
      *out = Json::array();
      for (const Value& item : value.items()) {
        Json encoded;
        if (!ToJson(item, &encoded, depth + 1, error)) return false;
        out->push_back(std::move(encoded));
      }
      return true;
    case script::Type::kDict:
      *out = Json::object();
      for (const auto& entry : value.dict().entries()) {
        const Value& key = entry.first;
        std::string name;
        if (key.is_str()) {
          name = key.str();
        } else if (key.is_none()) {
          name = "null";
        } else if (key.is_bool()) {
          name = key.bool_value() ? "true" : "false";
        } else if (key.is_number()) {
          name = script::Repr(key);
        } else {
          *error = "keys must be str, int, float, bool or None, not " +
                   script::TypeName(key);
          return false;
        }
        Json encoded;
        if (!ToJson(entry.second, &encoded, depth + 1, error)) return false;
        (*out)[name] = std::move(encoded);
      }
      return true;
    default:
      *error = "Object of type " + script::TypeName(value) +
               " is not JSON serializable";
      return false;
  }
}

struct DumpOptions {
  // Empty with indent_set false selects the single-line format.
  std::string indent;
  bool indent_set = false;
  bool sort_keys = false;
  bool ensure_ascii = true;
};

// Writes json with Python's separators: ", " and ": " on one line, or one
// item per line when indenting.
void Dump(const Json& json, const DumpOptions& options, int level,
          std::string* out) {
  if (!json.is_array() && !json.is_object()) {
    *out += json.dump(-1, ' ', options.ensure_ascii);
    return;
  }
  if (json.empty()) {
    *out += json.is_array() ? "[]" : "{}";
    return;
  }
  std::string inner, outer;
  if (options.indent_set) {
    inner = "\n";
    for (int i = 0; i <= level; i++) inner += options.indent;
    outer = inner.substr(0, inner.size() - options.indent.size());
  }
  const char* separator = options.indent_set ? "," : ", ";
  *out += json.is_array() ? "[" : "{";
  *out += inner;
  if (json.is_array()) {
    bool first = true;
    for (const Json& item : json) {
      if (!first) *out += separator + inner;
      first = false;
      Dump(item, options, level + 1, out);
    }
  } else {
    std::vector<std::pair<std::string, const Json*>> items;
    for (auto it = json.begin(); it != json.end(); ++it)
      items.emplace_back(it.key(), &it.value());
    if (options.sort_keys)
      std::stable_sort(items.begin(), items.end(),
                       [](const std::pair<std::string, const Json*>& a,
                          const std::pair<std::string, const Json*>& b) {
                         return a.first < b.first;
                       });
    bool first = true;
    for (const auto& item : items) {
      if (!first) *out += separator + inner;
      first = false;
      *out += Json(item.first).dump(-1, ' ', options.ensure_ascii);
      *out += ": ";
      Dump(*item.second, options, level + 1, out);
    }
  }
  *out += outer;
  *out += json.is_array() ? "]" : "}";
}

Value FromJson(const Json& json, int depth) {
  if (depth > kMaxJsonDepth)
    throw ScriptError("RecursionError",
                      "maximum recursion depth exceeded while decoding a JSON "
                      "document");
  switch (json.type()) {
    case Json::value_t::boolean:
      return Value::Bool(json.get<bool>());
    case Json::value_t::number_integer:
      return Value::Int(json.get<int64_t>());
    case Json::value_t::number_unsigned: {
      uint64_t n = json.get<uint64_t>();
      if (n <= static_cast<uint64_t>(INT64_MAX))
        return Value::Int(static_cast<int64_t>(n));
      return Value::Float(static_cast<double>(n));
    }
    case Json::value_t::number_float:
      return Value::Float(json.get<double>());
    case Json::value_t::string:
      return Value::Str(json.get<std::string>());
    case Json::value_t::array: {
      std::vector<Value> items;
      for (const Json& item : json) items.push_back(FromJson(item, depth + 1));
      return Value::List(std::move(items));
    }
    case Json::value_t::object: {
      Value dict = Value::NewDict();
      for (auto it = json.begin(); it != json.end(); ++it)
        dict.dict().Set(Value::Str(it.key()), FromJson(it.value(), depth + 1));
      return dict;
    }
    default:
      return Value::None();
  }
}

Value JsonModule(Interpreter*) {
  ModuleBuilder json("json");
  json.Function("dumps", [](Interpreter*, CallArgs* args) {
    args->Check("dumps", 1, 1, {"indent", "sort_keys", "ensure_ascii"});
    Json encoded;
    std::string error;
    if (!ToJson(args->args[0], &encoded, 0, &error))
      throw ScriptError("TypeError", error);
    DumpOptions options;
    const Value* indent = args->Get(SIZE_MAX, "indent");
    if (indent && !indent->is_none()) {
      options.indent_set = true;
      if (indent->is_str()) {
        options.indent = indent->str();
      } else if (indent->is_int()) {
        options.indent = std::string(std::max<int64_t>(indent->int_value(), 0),
                                     ' ');
      } else {
        throw ScriptError("TypeError", "indent must be int, str or None");
      }
    }
    const Value* sort_keys = args->Get(SIZE_MAX, "sort_keys");
    options.sort_keys = sort_keys && script::Truthy(*sort_keys);
    const Value* ensure_ascii = args->Get(SIZE_MAX, "ensure_ascii");
    options.ensure_ascii = !ensure_ascii || script::Truthy(*ensure_ascii);
    std::string out;
    try {
      Dump(encoded, options, 0, &out);
    } catch (const Json::exception& e) {
      throw ValueError(e.what());
    }
    return Value::Str(out);
  });
  json.Function("loads", [](Interpreter*, CallArgs* args) {
    args->Check("loads", 1, 1);
    const Value& text = args->args[0];
    if (!text.is_str())
      throw ScriptError("TypeError", "the JSON object must be str, not " +
                                         script::TypeName(text));
    Json parsed;
    try {
      parsed = Json::parse(text.str());
    } catch (const Json::parse_error& e) {
      throw ValueError(std::string("Invalid JSON: ") + e.what());
    }
    return FromJson(parsed, 0);
  });
  return json.Build();
}

// Shared by every import in the process; each sandboxed execution runs in
// its own process.
std::mt19937_64& Generator() {
  static std::mt19937_64* generator =
      new std::mt19937_64(std::random_device{}());
  return *generator;
}

int64_t RandomBelow(uint64_t n) {
  std::uniform_int_distribution<uint64_t> distribution(0, n - 1);
  return static_cast<int64_t>(distribution(Generator()));
}

Value RandomModule(Interpreter*) {
  ModuleBuilder random("random");
  random.Function("seed", [](Interpreter*, CallArgs* args) {
    args->Check("seed", 0, 1);
    const Value* seed = args->Get(0, nullptr);
    if (!seed || seed->is_none()) {
      Generator().seed(std::random_device{}());
    } else if (seed->is_int() || seed->is_bool()) {
      Generator().seed(static_cast<uint64_t>(seed->int_value()));
    } else {
      Generator().seed(std::hash<std::string>()(script::Repr(*seed)));
    }
    return Value::None();
  });
  random.Function("random", [](Interpreter*, CallArgs* args) {
    args->Check("random", 0, 0);
    return Value::Float(
        std::uniform_real_distribution<double>(0, 1)(Generator()));
  });
  random.Function("uniform", [](Interpreter*, CallArgs* args) {
    args->Check("uniform", 2, 2);
    double a = Number(*args, 0, "uniform");
    double b = Number(*args, 1, "uniform");
    double u = std::uniform_real_distribution<double>(0, 1)(Generator());
    return Value::Float(a + (b - a) * u);
  });
  random.Function("gauss", [](Interpreter*, CallArgs* args) {
    args->Check("gauss", 0, 2, {"mu", "sigma"});
    const Value* mu = args->Get(0, "mu");
    const Value* sigma = args->Get(1, "sigma");
    double m = mu && mu->is_number() ? mu->AsDouble() : 0;
    double s = sigma && sigma->is_number() ? sigma->AsDouble() : 1;
    return Value::Float(std::normal_distribution<double>(m, s)(Generator()));
  });
  random.Function("randint", [](Interpreter*, CallArgs* args) {
    args->Check("randint", 2, 2);
    int64_t a = Integer(*args, 0, "randint");
    int64_t b = Integer(*args, 1, "randint");
    if (b < a)
      throw ValueError(absl::StrCat("empty range for randint() (", a, ", ",
                                    b, ")"));
    return Value::Int(
        std::uniform_int_distribution<int64_t>(a, b)(Generator()));
  });
  random.Function("randrange", [](Interpreter*, CallArgs* args) {
    args->Check("randrange", 1, 3);
    int64_t start = 0;
    int64_t stop = Integer(*args, 0, "randrange");
    int64_t step = 1;
    if (args->args.size() > 1) {
      start = stop;
      stop = Integer(*args, 1, "randrange");
    }
    if (args->args.size() > 2) step = Integer(*args, 2, "randrange");
    if (step == 0) throw ValueError("zero step for randrange()");
    int64_t count = script::RangeObject(start, stop, step).Size();
    if (count <= 0) throw ValueError("empty range for randrange()");
    return Value::Int(start + step * RandomBelow(count));
  });
  random.Function("choice", [](Interpreter* interpreter, CallArgs* args) {
    args->Check("choice", 1, 1);
    std::vector<Value> items = interpreter->ToVector(args->args[0]);
    if (items.empty())
      throw ScriptError("IndexError", "Cannot choose from an empty sequence");
    return items[RandomBelow(items.size())];
  });
  random.Function("shuffle", [](Interpreter*, CallArgs* args) {
    args->Check("shuffle", 1, 1);
    if (!args->args[0].is_list())
      throw ScriptError("TypeError", "shuffle() argument must be a list");
    std::vector<Value>& items = args->args[0].items();
    for (size_t i = items.size(); i > 1; i--)
      std::swap(items[i - 1], items[RandomBelow(i)]);
    return Value::None();
  });
  random.Function("sample", [](Interpreter* interpreter, CallArgs* args) {
    args->Check("sample", 2, 2, {"k"});
    std::vector<Value> items = interpreter->ToVector(args->args[0]);
    int64_t k = Integer(*args, 1, "sample");
    if (k < 0 || k > static_cast<int64_t>(items.size()))
      throw ValueError("Sample larger than population or is negative");
    for (int64_t i = 0; i < k; i++)
      std::swap(items[i], items[i + RandomBelow(items.size() - i)]);
    items.resize(k);
    return Value::List(std::move(items));
  });
  return random.Build();
}

Value StringModule(Interpreter*) {
  static const constexpr char kLower[] = "abcdefghijklmnopqrstuvwxyz";
  static const constexpr char kUpper[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
  static const constexpr char kDigits[] = "0123456789";
  static const constexpr char kPunctuation[] =
      "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";
  static const constexpr char kWhitespace[] = " \t\n\r\x0b\x0c";
  ModuleBuilder string("string");
  string.Constant("ascii_lowercase", Value::Str(kLower))
      .Constant("ascii_uppercase", Value::Str(kUpper))
      .Constant("ascii_letters", Value::Str(absl::StrCat(kLower, kUpper)))
      .Constant("digits", Value::Str(kDigits))
      .Constant("hexdigits", Value::Str("0123456789abcdefABCDEF"))
      .Constant("octdigits", Value::Str("01234567"))
      .Constant("punctuation", Value::Str(kPunctuation))
      .Constant("whitespace", Value::Str(kWhitespace))
      .Constant("printable",
                Value::Str(absl::StrCat(kDigits, kLower, kUpper, kPunctuation,
                                        kWhitespace)));
  string.Function("capwords", [](Interpreter*, CallArgs* args) {
    args->Check("capwords", 1, 2);
    const Value& s = args->args[0];
    if (!s.is_str())
      throw ScriptError("TypeError", "capwords() argument must be str");
    std::string out;
    std::string word;
    auto flush = [&]() {
      if (word.empty()) return;
      if (!out.empty()) out += ' ';
      word[0] = absl::ascii_toupper(word[0]);
      for (size_t i = 1; i < word.size(); i++)
        word[i] = absl::ascii_tolower(word[i]);
      out += word;
      word.clear();
    };
    for (char c : s.str()) {
      if (absl::ascii_isspace(c)) {
        flush();
      } else {
        word += c;
      }
    }
    flush();
    return Value::Str(out);
  });
  return string.Build();
}

}  // namespace

const std::map<std::string, script::Interpreter::ModuleFactory>&
ModuleFactories() {
  static const auto* factories =
      new std::map<std::string, script::Interpreter::ModuleFactory>{
          {"math", MathModule},
          {"json", JsonModule},
          {"random", RandomModule},
          {"string", StringModule}};
  return *factories;
}

}  // namespace capability
