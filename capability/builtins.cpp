#include "capability/builtins.hpp"

#include <math.h>
#include <stdlib.h>

#include <algorithm>
#include <memory>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "capability/value_codec.hpp"
#include "script/format.hpp"
#include "script/interpreter.hpp"
#include "util/misc.hpp"

namespace capability {

namespace {

using script::CallArgs;
using script::Interpreter;
using script::ScriptError;
using script::Value;

ScriptError TypeError(const std::string& msg) {
  return ScriptError("TypeError", msg);
}

ScriptError ValueError(const std::string& msg) {
  return ScriptError("ValueError", msg);
}

const Value& Arg(const CallArgs& args, size_t position, const char* name) {
  static const Value* none = new Value();
  const Value* value = args.Get(position, name);
  return value ? *value : *none;
}

int64_t IntArg(const CallArgs& args, size_t position, const char* name,
               const char* function) {
  const Value& value = Arg(args, position, name);
  if (!value.is_int() && !value.is_bool())
    throw TypeError(absl::StrCat(function, "() argument must be int, not ",
                                 script::TypeName(value)));
  return value.int_value();
}

std::string CodePointToUtf8(int64_t cp) {
  std::string out;
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xc0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3f));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xe0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
    out += static_cast<char>(0x80 | (cp & 0x3f));
  } else {
    out += static_cast<char>(0xf0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
    out += static_cast<char>(0x80 | (cp & 0x3f));
  }
  return out;
}

int64_t Utf8ToCodePoint(const std::string& s) {
  unsigned char c = s[0];
  if (c < 0x80) return c;
  int extra = c >= 0xf0 ? 3 : c >= 0xe0 ? 2 : 1;
  int64_t cp = c & (0x3f >> extra);
  for (int i = 1; i <= extra && i < static_cast<int>(s.size()); i++)
    cp = (cp << 6) | (static_cast<unsigned char>(s[i]) & 0x3f);
  return cp;
}

Value IntFromString(const std::string& text, int64_t base) {
  std::string s(absl::StripAsciiWhitespace(text));
  auto invalid = [&]() {
    return ValueError(absl::StrCat("invalid literal for int() with base ",
                                   base, ": ", script::Repr(Value::Str(text))));
  };
  if (base != 0 && (base < 2 || base > 36))
    throw ValueError("int() base must be >= 2 and <= 36, or 0");
  bool negative = false;
  size_t pos = 0;
  if (pos < s.size() && (s[pos] == '+' || s[pos] == '-'))
    negative = s[pos++] == '-';
  auto has_prefix = [&](char p) {
    return pos + 1 < s.size() && s[pos] == '0' &&
           absl::ascii_tolower(s[pos + 1]) == p;
  };
  if ((base == 16 || base == 0) && has_prefix('x')) {
    base = 16;
    pos += 2;
  } else if ((base == 8 || base == 0) && has_prefix('o')) {
    base = 8;
    pos += 2;
  } else if ((base == 2 || base == 0) && has_prefix('b')) {
    base = 2;
    pos += 2;
  } else if (base == 0) {
    base = 10;
  }
  std::string digits;
  for (; pos < s.size(); pos++) {
    if (s[pos] == '_' && !digits.empty() && pos + 1 < s.size() &&
        s[pos + 1] != '_')
      continue;
    digits += s[pos];
  }
  if (digits.empty()) throw invalid();
  uint64_t magnitude = 0;
  for (char c : digits) {
    int digit;
    if (absl::ascii_isdigit(c)) {
      digit = c - '0';
    } else if (absl::ascii_isalpha(c)) {
      digit = absl::ascii_tolower(c) - 'a' + 10;
    } else {
      throw invalid();
    }
    if (digit >= base) throw invalid();
    if (__builtin_mul_overflow(magnitude, static_cast<uint64_t>(base),
                               &magnitude) ||
        __builtin_add_overflow(magnitude, static_cast<uint64_t>(digit),
                               &magnitude))
      throw ScriptError("OverflowError", "integer overflow");
  }
  uint64_t limit = negative ? (uint64_t{1} << 63) : (uint64_t{1} << 63) - 1;
  if (magnitude > limit)
    throw ScriptError("OverflowError", "integer overflow");
  return Value::Int(negative ? static_cast<int64_t>(0 - magnitude)
                             : static_cast<int64_t>(magnitude));
}

Value IntFromFloat(double f) {
  if (isnan(f)) throw ValueError("cannot convert float NaN to integer");
  if (isinf(f))
    throw ScriptError("OverflowError",
                      "cannot convert float infinity to integer");
  double t = trunc(f);
  if (t < -9223372036854775808.0 || t >= 9223372036854775808.0)
    throw ScriptError("OverflowError", "integer overflow");
  return Value::Int(static_cast<int64_t>(t));
}

Value Int(Interpreter*, CallArgs* args) {
  args->Check("int", 0, 2, {"base"});
  const Value& x = Arg(*args, 0, nullptr);
  const Value* base = args->Get(1, "base");
  if (args->args.empty()) return Value::Int(0);
  if (base) {
    if (!x.is_str())
      throw TypeError("int() can't convert non-string with explicit base");
    return IntFromString(x.str(), IntArg(*args, 1, "base", "int"));
  }
  switch (x.type()) {
    case script::Type::kBool:
    case script::Type::kInt:
      return Value::Int(x.int_value());
    case script::Type::kFloat:
      return IntFromFloat(x.float_value());
    case script::Type::kStr:
      return IntFromString(x.str(), 10);
    default:
      throw TypeError("int() argument must be a string or a number, not '" +
                      script::TypeName(x) + "'");
  }
}

Value Float(Interpreter*, CallArgs* args) {
  args->Check("float", 0, 1);
  if (args->args.empty()) return Value::Float(0);
  const Value& x = args->args[0];
  if (x.is_number()) return Value::Float(x.AsDouble());
  if (!x.is_str())
    throw TypeError("float() argument must be a string or a number, not '" +
                    script::TypeName(x) + "'");
  std::string s(absl::StripAsciiWhitespace(x.str()));
  std::string lower = absl::AsciiStrToLower(s);
  std::string unsigned_part =
      !lower.empty() && (lower[0] == '+' || lower[0] == '-') ? lower.substr(1)
                                                             : lower;
  double sign = !lower.empty() && lower[0] == '-' ? -1 : 1;
  if (unsigned_part == "inf" || unsigned_part == "infinity")
    return Value::Float(sign * HUGE_VAL);
  if (unsigned_part == "nan") return Value::Float(NAN);
  std::string digits;
  for (char c : s) {
    if (c != '_') digits += c;
  }
  bool valid = !digits.empty() && lower.find("0x") == std::string::npos;
  for (char c : lower) {
    valid &= absl::ascii_isdigit(c) || c == '.' || c == 'e' || c == '+' ||
             c == '-' || c == '_';
  }
  char* end = nullptr;
  double f = valid ? strtod(digits.c_str(), &end) : 0;
  if (!valid || end != digits.c_str() + digits.size())
    throw ValueError("could not convert string to float: " +
                     script::Repr(x));
  return Value::Float(f);
}

Value Str(Interpreter*, CallArgs* args) {
  args->Check("str", 0, 1);
  if (args->args.empty()) return Value::Str("");
  return Value::Str(script::Str(args->args[0]));
}

Value Bool(Interpreter*, CallArgs* args) {
  args->Check("bool", 0, 1);
  return Value::Bool(!args->args.empty() && script::Truthy(args->args[0]));
}

Value List(Interpreter* interpreter, CallArgs* args) {
  args->Check("list", 0, 1);
  if (args->args.empty()) return Value::List();
  return Value::List(interpreter->ToVector(args->args[0]));
}

Value Tuple(Interpreter* interpreter, CallArgs* args) {
  args->Check("tuple", 0, 1);
  if (args->args.empty()) return Value::Tuple();
  if (args->args[0].is_tuple()) return args->args[0];
  return Value::Tuple(interpreter->ToVector(args->args[0]));
}

Value Dict(Interpreter* interpreter, CallArgs* args) {
  if (args->args.size() > 1)
    throw TypeError(absl::StrCat("dict expected at most 1 argument, got ",
                                 args->args.size()));
  Value dict = Value::NewDict();
  if (!args->args.empty()) {
    const Value& source = args->args[0];
    if (source.is_dict()) {
      for (const auto& entry : source.dict().entries())
        dict.dict().Set(entry.first, entry.second);
    } else {
      interpreter->ForEach(source, [&](const Value& item) {
        std::vector<Value> pair = interpreter->ToVector(item);
        if (pair.size() != 2)
          throw ValueError(absl::StrCat(
              "dictionary update sequence element has length ", pair.size(),
              "; 2 is required"));
        dict.dict().Set(pair[0], pair[1]);
        return true;
      });
    }
  }
  for (const auto& kwarg : args->kwargs)
    dict.dict().Set(Value::Str(kwarg.first), kwarg.second);
  return dict;
}

Value Range(Interpreter*, CallArgs* args) {
  args->Check("range", 1, 3);
  int64_t start = 0;
  int64_t stop;
  int64_t step = 1;
  if (args->args.size() == 1) {
    stop = IntArg(*args, 0, nullptr, "range");
  } else {
    start = IntArg(*args, 0, nullptr, "range");
    stop = IntArg(*args, 1, nullptr, "range");
    if (args->args.size() == 3) step = IntArg(*args, 2, nullptr, "range");
  }
  if (step == 0) throw ValueError("range() arg 3 must not be zero");
  return Value::Range(start, stop, step);
}

Value Len(Interpreter*, CallArgs* args) {
  args->Check("len", 1, 1);
  const Value& x = args->args[0];
  switch (x.type()) {
    case script::Type::kStr:
      return Value::Int(script::CodePointCount(x.str()));
    case script::Type::kList:
    case script::Type::kTuple:
      return Value::Int(x.items().size());
    case script::Type::kDict:
      return Value::Int(x.dict().size());
    case script::Type::kRange:
      return Value::Int(x.range().Size());
    default:
      throw TypeError("object of type '" + script::TypeName(x) +
                      "' has no len()");
  }
}

Value Enumerate(Interpreter* interpreter, CallArgs* args) {
  args->Check("enumerate", 1, 2, {"start"});
  int64_t index = args->Get(1, "start") ? IntArg(*args, 1, "start", "enumerate")
                                        : 0;
  std::vector<Value> out;
  interpreter->ForEach(args->args[0], [&](const Value& item) {
    out.push_back(Value::Tuple({Value::Int(index++), item}));
    return true;
  });
  return Value::List(std::move(out));
}

Value Zip(Interpreter* interpreter, CallArgs* args) {
  args->Check("zip", 0, SIZE_MAX);
  std::vector<std::vector<Value>> columns;
  size_t length = SIZE_MAX;
  for (const Value& iterable : args->args) {
    columns.push_back(interpreter->ToVector(iterable));
    length = std::min(length, columns.back().size());
  }
  if (columns.empty()) return Value::List();
  std::vector<Value> out;
  for (size_t i = 0; i < length; i++) {
    std::vector<Value> row;
    for (const auto& column : columns) row.push_back(column[i]);
    out.push_back(Value::Tuple(std::move(row)));
  }
  return Value::List(std::move(out));
}

Value Map(Interpreter* interpreter, CallArgs* args) {
  if (args->args.size() < 2)
    throw TypeError("map() must have at least two arguments.");
  args->Check("map", 2, SIZE_MAX);
  std::vector<std::vector<Value>> columns;
  size_t length = SIZE_MAX;
  for (size_t i = 1; i < args->args.size(); i++) {
    columns.push_back(interpreter->ToVector(args->args[i]));
    length = std::min(length, columns.back().size());
  }
  std::vector<Value> out;
  for (size_t i = 0; i < length; i++) {
    CallArgs call;
    for (const auto& column : columns) call.args.push_back(column[i]);
    out.push_back(interpreter->Call(args->args[0], std::move(call)));
  }
  return Value::List(std::move(out));
}

Value Filter(Interpreter* interpreter, CallArgs* args) {
  args->Check("filter", 2, 2);
  const Value& predicate = args->args[0];
  std::vector<Value> out;
  interpreter->ForEach(args->args[1], [&](const Value& item) {
    bool keep;
    if (predicate.is_none()) {
      keep = script::Truthy(item);
    } else {
      CallArgs call;
      call.args.push_back(item);
      keep = script::Truthy(interpreter->Call(predicate, std::move(call)));
    }
    if (keep) out.push_back(item);
    return true;
  });
  return Value::List(std::move(out));
}

Value Sorted(Interpreter* interpreter, CallArgs* args) {
  args->Check("sorted", 1, 1, {"key", "reverse"});
  std::vector<Value> items = interpreter->ToVector(args->args[0]);
  const Value* reverse = args->Get(SIZE_MAX, "reverse");
  script::SortValues(interpreter, &items, Arg(*args, SIZE_MAX, "key"),
                     reverse && script::Truthy(*reverse));
  return Value::List(std::move(items));
}

Value Reversed(Interpreter* interpreter, CallArgs* args) {
  args->Check("reversed", 1, 1);
  const Value& x = args->args[0];
  if (x.is_dict())
    throw TypeError("'dict' object is not reversible");
  std::vector<Value> items = interpreter->ToVector(x);
  std::reverse(items.begin(), items.end());
  return Value::List(std::move(items));
}

Value MinMax(Interpreter* interpreter, CallArgs* args, const char* function,
             bool want_max) {
  args->Check(function, 1, SIZE_MAX, {"key", "default"});
  std::vector<Value> items = args->args.size() == 1
                                 ? interpreter->ToVector(args->args[0])
                                 : args->args;
  const Value* default_value = args->Get(SIZE_MAX, "default");
  if (items.empty()) {
    if (default_value) return *default_value;
    throw ValueError(absl::StrCat(function, "() arg is an empty sequence"));
  }
  const Value& key = Arg(*args, SIZE_MAX, "key");
  auto key_of = [&](const Value& item) {
    if (key.is_none()) return item;
    CallArgs call;
    call.args.push_back(item);
    return interpreter->Call(key, std::move(call));
  };
  size_t best = 0;
  Value best_key = key_of(items[0]);
  for (size_t i = 1; i < items.size(); i++) {
    Value k = key_of(items[i]);
    bool better = want_max ? interpreter->Less(best_key, k)
                           : interpreter->Less(k, best_key);
    if (better) {
      best = i;
      best_key = k;
    }
  }
  return items[best];
}

Value Min(Interpreter* interpreter, CallArgs* args) {
  return MinMax(interpreter, args, "min", false);
}

Value Max(Interpreter* interpreter, CallArgs* args) {
  return MinMax(interpreter, args, "max", true);
}

Value Sum(Interpreter* interpreter, CallArgs* args) {
  args->Check("sum", 1, 2, {"start"});
  Value total = args->Get(1, "start") ? Arg(*args, 1, "start") : Value::Int(0);
  if (total.is_str())
    throw TypeError("sum() can't sum strings [use ''.join(seq) instead]");
  interpreter->ForEach(args->args[0], [&](const Value& item) {
    total = interpreter->BinaryOp(script::ast::BinOp::kAdd, total, item);
    return true;
  });
  return total;
}

Value Abs(Interpreter*, CallArgs* args) {
  args->Check("abs", 1, 1);
  const Value& x = args->args[0];
  if (x.is_float()) return Value::Float(fabs(x.float_value()));
  if (x.is_int() || x.is_bool()) {
    if (x.int_value() == INT64_MIN)
      throw ScriptError("OverflowError", "integer overflow");
    return Value::Int(x.int_value() < 0 ? -x.int_value() : x.int_value());
  }
  throw TypeError("bad operand type for abs(): '" + script::TypeName(x) + "'");
}

// Rounds half to even, like Python.
int64_t RoundInt(int64_t x, int64_t digits) {
  if (digits >= 0) return x;
  if (digits < -18) return 0;
  int64_t unit = 1;
  for (int64_t i = 0; i < -digits; i++) unit *= 10;
  int64_t q = x / unit;
  int64_t r = x % unit;
  if (r < 0) {
    q--;
    r += unit;
  }
  if (2 * r > unit || (2 * r == unit && (q & 1))) q++;
  int64_t result;
  if (__builtin_mul_overflow(q, unit, &result))
    throw ScriptError("OverflowError", "integer overflow");
  return result;
}

Value Round(Interpreter*, CallArgs* args) {
  args->Check("round", 1, 2, {"ndigits"});
  const Value& x = args->args[0];
  const Value& ndigits = Arg(*args, 1, "ndigits");
  if (!x.is_number())
    throw TypeError("type " + script::TypeName(x) +
                    " doesn't define __round__ method");
  if (ndigits.is_none()) {
    if (!x.is_float()) return Value::Int(x.int_value());
    return IntFromFloat(nearbyint(x.float_value()));
  }
  int64_t digits = IntArg(*args, 1, "ndigits", "round");
  if (!x.is_float()) return Value::Int(RoundInt(x.int_value(), digits));
  double f = x.float_value();
  if (isnan(f) || isinf(f)) return x;
  if (digits >= 0) {
    if (digits > 300) return x;
    // The decimal conversion is correctly rounded, which gives the same
    // result as Python for values like 2.675.
    std::string text = absl::StrCat(script::FormatValue(
        x, absl::StrCat(".", digits, "f")));
    return Value::Float(strtod(text.c_str(), nullptr));
  }
  double unit = pow(10.0, static_cast<double>(-digits));
  return Value::Float(nearbyint(f / unit) * unit);
}

Value Pow(Interpreter* interpreter, CallArgs* args) {
  args->Check("pow", 2, 3);
  if (args->args.size() == 2 || args->args[2].is_none())
    return interpreter->BinaryOp(script::ast::BinOp::kPow, args->args[0],
                                 args->args[1]);
  int64_t base = IntArg(*args, 0, nullptr, "pow");
  int64_t exp = IntArg(*args, 1, nullptr, "pow");
  int64_t mod = IntArg(*args, 2, nullptr, "pow");
  if (mod == 0) throw ValueError("pow() 3rd argument cannot be 0");
  if (exp < 0)
    throw ValueError("pow() 2nd argument cannot be negative when 3rd "
                     "argument specified");
  __int128 m = mod < 0 ? -static_cast<__int128>(mod) : mod;
  __int128 b = base % m;
  if (b < 0) b += m;
  __int128 result = 1 % m;
  while (exp > 0) {
    if (exp & 1) result = result * b % m;
    b = b * b % m;
    exp >>= 1;
  }
  if (mod < 0 && result != 0) result -= m;
  return Value::Int(static_cast<int64_t>(result));
}

Value Divmod(Interpreter* interpreter, CallArgs* args) {
  args->Check("divmod", 2, 2);
  return Value::Tuple(
      {interpreter->BinaryOp(script::ast::BinOp::kFloorDiv, args->args[0],
                             args->args[1]),
       interpreter->BinaryOp(script::ast::BinOp::kMod, args->args[0],
                             args->args[1])});
}

Value IsInstance(Interpreter* interpreter, CallArgs* args) {
  args->Check("isinstance", 2, 2);
  return Value::Bool(interpreter->IsInstance(args->args[0], args->args[1]));
}

Value Repr(Interpreter*, CallArgs* args) {
  args->Check("repr", 1, 1);
  return Value::Str(script::Repr(args->args[0]));
}

Value Format(Interpreter*, CallArgs* args) {
  args->Check("format", 1, 2);
  const Value& spec = Arg(*args, 1, nullptr);
  if (!spec.is_none() && !spec.is_str())
    throw TypeError("format() argument 2 must be str");
  return Value::Str(
      script::FormatValue(args->args[0], spec.is_str() ? spec.str() : ""));
}

Value Chr(Interpreter*, CallArgs* args) {
  args->Check("chr", 1, 1);
  int64_t cp = IntArg(*args, 0, nullptr, "chr");
  if (cp < 0 || cp > 0x10ffff) throw ValueError("chr() arg not in range(0x110000)");
  return Value::Str(CodePointToUtf8(cp));
}

Value Ord(Interpreter*, CallArgs* args) {
  args->Check("ord", 1, 1);
  const Value& c = args->args[0];
  if (!c.is_str())
    throw TypeError("ord() expected string of length 1, but " +
                    script::TypeName(c) + " found");
  int64_t length = script::CodePointCount(c.str());
  if (length != 1)
    throw TypeError(absl::StrCat(
        "ord() expected a character, but string of length ", length,
        " found"));
  return Value::Int(Utf8ToCodePoint(c.str()));
}

Value RadixString(CallArgs* args, const char* function, int bits,
                  const char* prefix) {
  args->Check(function, 1, 1);
  int64_t x = IntArg(*args, 0, nullptr, function);
  uint64_t magnitude = x < 0 ? 0 - static_cast<uint64_t>(x) : x;
  static const constexpr char kDigits[] = "0123456789abcdef";
  std::string digits;
  do {
    digits += kDigits[magnitude & ((1u << bits) - 1)];
    magnitude >>= bits;
  } while (magnitude);
  std::reverse(digits.begin(), digits.end());
  return Value::Str(absl::StrCat(x < 0 ? "-" : "", prefix, digits));
}

Value Hex(Interpreter*, CallArgs* args) {
  return RadixString(args, "hex", 4, "0x");
}

Value Oct(Interpreter*, CallArgs* args) {
  return RadixString(args, "oct", 3, "0o");
}

Value Bin(Interpreter*, CallArgs* args) {
  return RadixString(args, "bin", 1, "0b");
}

Value AnyAll(Interpreter* interpreter, CallArgs* args, const char* function,
             bool want) {
  args->Check(function, 1, 1);
  bool found = false;
  interpreter->ForEach(args->args[0], [&](const Value& item) {
    if (script::Truthy(item) == want) {
      found = true;
      return false;
    }
    return true;
  });
  return Value::Bool(want ? found : !found);
}

Value Any(Interpreter* interpreter, CallArgs* args) {
  return AnyAll(interpreter, args, "any", true);
}

Value All(Interpreter* interpreter, CallArgs* args) {
  return AnyAll(interpreter, args, "all", false);
}

// Data-valued variables of a frame, for debug events.
void FillLocals(const Interpreter::Frame& frame, proto::FrameInfo* info) {
  static const constexpr size_t kMaxLocals = 50;
  info->set_function(frame.function);
  info->set_line(frame.line);
  if (!frame.scope) return;
  for (const auto& var : frame.scope->vars) {
    if (static_cast<size_t>(info->locals_size()) >= kMaxLocals) break;
    switch (var.second.type()) {
      case script::Type::kFunction:
      case script::Type::kNative:
      case script::Type::kModule:
      case script::Type::kClass:
        continue;
      default:
        break;
    }
    (*info->mutable_locals())[var.first] = util::Truncate(
        script::Repr(var.second), debugger::kMaxReprLength);
  }
}

}  // namespace

Builtins Primitives() {
  Builtins builtins;
  auto type = [&builtins](const char* name, script::NativeFn fn) {
    builtins[name] = script::MakeType(name, std::move(fn));
  };
  auto function = [&builtins](const char* name, script::NativeFn fn) {
    builtins[name] = script::MakeNative(name, std::move(fn));
  };
  type("int", Int);
  type("float", Float);
  type("str", Str);
  type("bool", Bool);
  type("list", List);
  type("tuple", Tuple);
  type("dict", Dict);
  type("range", Range);
  function("len", Len);
  function("enumerate", Enumerate);
  function("zip", Zip);
  function("map", Map);
  function("filter", Filter);
  function("sorted", Sorted);
  function("reversed", Reversed);
  function("min", Min);
  function("max", Max);
  function("sum", Sum);
  function("abs", Abs);
  function("round", Round);
  function("pow", Pow);
  function("divmod", Divmod);
  function("isinstance", IsInstance);
  function("repr", Repr);
  function("format", Format);
  function("chr", Chr);
  function("ord", Ord);
  function("hex", Hex);
  function("oct", Oct);
  function("bin", Bin);
  function("any", Any);
  function("all", All);

  // type() hands back the constructors above, so that
  // "type(x) == int" and "type(x)(y)" work.
  auto types = std::make_shared<Builtins>(builtins);
  type("type", [types](Interpreter* interpreter, CallArgs* args) {
    args->Check("type", 1, 1);
    const Value& x = args->args[0];
    if (x.type() == script::Type::kException)
      return interpreter->ExceptionClass(script::TypeName(x));
    std::string name = script::TypeName(x);
    auto it = types->find(name);
    if (it != types->end() && it->second.object<script::NativeObject>()->is_type)
      return it->second;
    return script::MakeType(name, [name](Interpreter*, CallArgs*) -> Value {
      throw TypeError("cannot create '" + name + "' instances");
    });
  });
  return builtins;
}

Value MakePrint(OutputBuffer* out) {
  return script::MakeNative("print", [out](Interpreter*, CallArgs* args) {
    args->Check("print", 0, SIZE_MAX, {"sep", "end", "flush"});
    const Value& sep = Arg(*args, SIZE_MAX, "sep");
    const Value& end = Arg(*args, SIZE_MAX, "end");
    if ((!sep.is_none() && !sep.is_str()) || (!end.is_none() && !end.is_str()))
      throw TypeError("sep and end must be None or a string");
    std::string text;
    for (size_t i = 0; i < args->args.size(); i++) {
      if (i) text += sep.is_str() ? sep.str() : " ";
      text += script::Str(args->args[i]);
    }
    text += end.is_str() ? end.str() : "\n";
    out->Write(text);
    return Value::None();
  });
}

Builtins DebugBuiltins(debugger::Debugger* recorder) {
  Builtins builtins;
  builtins["debug"] = script::MakeNative(
      "debug", [recorder](Interpreter* interpreter, CallArgs* args) {
        args->Check("debug", 1, 3, {"message", "level", "data"});
        const Value& level = Arg(*args, 1, "level");
        const Value* data = args->Get(2, "data");
        proto::FrameInfo frame;
        FillLocals(interpreter->CurrentFrame(), &frame);
        recorder->Log(
            script::Str(Arg(*args, 0, "message")),
            debugger::ParseLevel(level.is_str() ? level.str() : "INFO"),
            data && !data->is_none()
                ? util::Truncate(script::Repr(*data), debugger::kMaxReprLength)
                : "",
            &frame);
        return Value::None();
      });
  builtins["inspect_var"] = script::MakeNative(
      "inspect_var", [recorder](Interpreter*, CallArgs* args) {
        args->Check("inspect_var", 2, 2, {"name", "value"});
        const Value& name = Arg(*args, 0, "name");
        if (!name.is_str()) throw TypeError("inspect_var() name must be str");
        const Value& value = Arg(*args, 1, "value");
        recorder->InspectVar(
            name.str(),
            util::Truncate(script::Repr(value), debugger::kMaxReprLength),
            script::TypeName(value), script::SizeEstimate(value));
        return Value::None();
      });
  builtins["get_debug_info"] = script::MakeNative(
      "get_debug_info", [recorder](Interpreter*, CallArgs* args) {
        args->Check("get_debug_info", 0, 0);
        proto::DebugSummary summary = recorder->Summary();
        Value info = Value::NewDict();
        info.dict().Set(Value::Str("total_events"),
                        Value::Int(summary.total_events()));
        info.dict().Set(Value::Str("dropped_events"),
                        Value::Int(summary.dropped_events()));
        Value levels = Value::NewDict();
        for (const auto& count : summary.level_count())
          levels.dict().Set(Value::Str(debugger::LevelName(count.level())),
                            Value::Int(count.count()));
        info.dict().Set(Value::Str("levels"), levels);
        std::vector<Value> names;
        for (const std::string& name : summary.variable_name())
          names.push_back(Value::Str(name));
        info.dict().Set(Value::Str("variables"), Value::List(std::move(names)));
        return info;
      });
  return builtins;
}

Builtins DatabaseBuiltins(Database* database) {
  Builtins builtins;
  auto rows_to_list = [](const std::vector<proto::Row>& rows) {
    std::vector<Value> out;
    out.reserve(rows.size());
    for (const proto::Row& row : rows) out.push_back(RowToDict(row));
    return Value::List(std::move(out));
  };
  builtins["db_query"] = script::MakeNative(
      "db_query", [database, rows_to_list](Interpreter*, CallArgs* args) {
        args->Check("db_query", 1, 2, {"query", "params"});
        const Value& query = Arg(*args, 0, "query");
        if (!query.is_str()) throw TypeError("db_query() query must be str");
        const Value& params = Arg(*args, 1, "params");
        proto::ValueDict encoded;
        std::string error;
        if (!params.is_none() && !DictToProto(params, &encoded, &error))
          throw TypeError("db_query() params: " + error);
        try {
          return rows_to_list(database->Query(query.str(), encoded));
        } catch (const database_error& e) {
          throw ScriptError("RuntimeError",
                            std::string("database error: ") + e.what());
        }
      });
  builtins["db_tables"] =
      script::MakeNative("db_tables", [database](Interpreter*, CallArgs* args) {
        args->Check("db_tables", 0, 0);
        try {
          std::vector<Value> out;
          for (const std::string& table : database->Tables())
            out.push_back(Value::Str(table));
          return Value::List(std::move(out));
        } catch (const database_error& e) {
          throw ScriptError("RuntimeError",
                            std::string("database error: ") + e.what());
        }
      });
  builtins["db_schema"] = script::MakeNative(
      "db_schema", [database, rows_to_list](Interpreter*, CallArgs* args) {
        args->Check("db_schema", 1, 1, {"table"});
        const Value& table = Arg(*args, 0, "table");
        if (!table.is_str()) throw TypeError("db_schema() table must be str");
        try {
          return rows_to_list(database->Schema(table.str()));
        } catch (const database_error& e) {
          throw ScriptError("RuntimeError",
                            std::string("database error: ") + e.what());
        }
      });
  return builtins;
}

}  // namespace capability
