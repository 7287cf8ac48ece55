#include "script/value.hpp"

#include <cmath>
#include <stdio.h>
#include <stdlib.h>

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "script/errors.hpp"

namespace {

using script::Object;
using script::Type;
using script::Value;

// Containers deeper than this are printed as "..." and compared as a
// RecursionError.
static const constexpr size_t kMaxNesting = 200;

std::string StrRepr(const std::string& s) {
  char quote = '\'';
  if (s.find('\'') != std::string::npos && s.find('"') == std::string::npos)
    quote = '"';
  std::string out(1, quote);
  for (unsigned char c : s) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c == static_cast<unsigned char>(quote)) {
          out += '\\';
          out += quote;
        } else if (c < 0x20 || c == 0x7f) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\x%02x", c);
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += quote;
  return out;
}

std::string ReprImpl(const Value& value, std::vector<const Object*>* path);

std::string JoinRepr(const std::vector<Value>& items,
                     std::vector<const Object*>* path) {
  std::string out;
  for (size_t i = 0; i < items.size(); i++) {
    if (i) out += ", ";
    out += ReprImpl(items[i], path);
  }
  return out;
}

std::string ReprImpl(const Value& value, std::vector<const Object*>* path) {
  const Object* id = value.identity();
  bool container = value.type() == Type::kList ||
                   value.type() == Type::kTuple ||
                   value.type() == Type::kDict;
  if (container) {
    if (std::find(path->begin(), path->end(), id) != path->end() ||
        path->size() > kMaxNesting) {
      return value.type() == Type::kDict ? "{...}" : "[...]";
    }
    path->push_back(id);
  }
  std::string out;
  switch (value.type()) {
    case Type::kNone:
      out = "None";
      break;
    case Type::kBool:
      out = value.bool_value() ? "True" : "False";
      break;
    case Type::kInt:
      out = absl::StrCat(value.int_value());
      break;
    case Type::kFloat:
      out = script::FloatRepr(value.float_value());
      break;
    case Type::kStr:
      out = StrRepr(value.str());
      break;
    case Type::kList:
      out = "[" + JoinRepr(value.items(), path) + "]";
      break;
    case Type::kTuple:
      out = "(" + JoinRepr(value.items(), path) +
            (value.items().size() == 1 ? ",)" : ")");
      break;
    case Type::kDict: {
      out = "{";
      bool first = true;
      for (const auto& entry : value.dict().entries()) {
        if (!first) out += ", ";
        first = false;
        out += ReprImpl(entry.first, path) + ": " +
               ReprImpl(entry.second, path);
      }
      out += "}";
      break;
    }
    case Type::kRange: {
      const script::RangeObject& r = value.range();
      out = absl::StrCat("range(", r.start, ", ", r.stop);
      if (r.step != 1) absl::StrAppend(&out, ", ", r.step);
      out += ")";
      break;
    }
    case Type::kFunction:
      out = "<function " + value.object<script::FunctionObject>()->name + ">";
      break;
    case Type::kNative: {
      auto* native = value.object<script::NativeObject>();
      out = native->is_type ? "<class '" + native->name + "'>"
                            : "<built-in function " + native->name + ">";
      break;
    }
    case Type::kModule:
      out = "<module '" + value.object<script::ModuleObject>()->name + "'>";
      break;
    case Type::kClass:
      out = "<class '" + value.object<script::ClassObject>()->name + "'>";
      break;
    case Type::kException: {
      auto* exc = value.object<script::ExceptionObject>();
      out = exc->cls->name + "(" + JoinRepr(exc->args, path) + ")";
      break;
    }
  }
  if (container) path->pop_back();
  return out;
}

bool EqualsImpl(const Value& a, const Value& b, size_t depth) {
  if (depth > kMaxNesting)
    throw script::ScriptError("RecursionError",
                              "maximum recursion depth exceeded in comparison");
  if (a.is_number() && b.is_number()) {
    if (a.is_float() || b.is_float()) return a.AsDouble() == b.AsDouble();
    return a.int_value() == b.int_value();
  }
  if (a.type() != b.type()) return false;
  switch (a.type()) {
    case Type::kNone:
      return true;
    case Type::kStr:
      return a.str() == b.str();
    case Type::kList:
    case Type::kTuple: {
      if (a.identity() == b.identity()) return true;
      const std::vector<Value>& x = a.items();
      const std::vector<Value>& y = b.items();
      if (x.size() != y.size()) return false;
      for (size_t i = 0; i < x.size(); i++) {
        if (!EqualsImpl(x[i], y[i], depth + 1)) return false;
      }
      return true;
    }
    case Type::kDict: {
      if (a.identity() == b.identity()) return true;
      if (a.dict().size() != b.dict().size()) return false;
      for (const auto& entry : a.dict().entries()) {
        Value* other = b.dict().Find(entry.first);
        if (!other || !EqualsImpl(entry.second, *other, depth + 1))
          return false;
      }
      return true;
    }
    case Type::kRange: {
      const script::RangeObject& x = a.range();
      const script::RangeObject& y = b.range();
      return x.start == y.start && x.stop == y.stop && x.step == y.step;
    }
    default:
      return a.identity() == b.identity();
  }
}

}  // namespace

namespace script {

Value Value::Bool(bool b) {
  Value v;
  v.type_ = Type::kBool;
  v.int_ = b ? 1 : 0;
  return v;
}

Value Value::Int(int64_t i) {
  Value v;
  v.type_ = Type::kInt;
  v.int_ = i;
  return v;
}

Value Value::Float(double f) {
  Value v;
  v.type_ = Type::kFloat;
  v.float_ = f;
  return v;
}

Value Value::Str(std::string s) {
  return FromObject(Type::kStr, std::make_shared<StrObject>(std::move(s)));
}

Value Value::List(std::vector<Value> items) {
  return FromObject(Type::kList, std::make_shared<SeqObject>(std::move(items)));
}

Value Value::Tuple(std::vector<Value> items) {
  return FromObject(Type::kTuple,
                    std::make_shared<SeqObject>(std::move(items)));
}

Value Value::NewDict() { return FromObject(Type::kDict, std::make_shared<Dict>()); }

Value Value::Range(int64_t start, int64_t stop, int64_t step) {
  return FromObject(Type::kRange,
                    std::make_shared<RangeObject>(start, stop, step));
}

Value Value::FromObject(Type type, std::shared_ptr<Object> object) {
  Value v;
  v.type_ = type;
  v.object_ = std::move(object);
  return v;
}

const std::string& Value::str() const {
  return static_cast<StrObject*>(object_.get())->value;
}

std::vector<Value>& Value::items() const {
  return static_cast<SeqObject*>(object_.get())->items;
}

Dict& Value::dict() const { return *static_cast<Dict*>(object_.get()); }

const RangeObject& Value::range() const {
  return *static_cast<RangeObject*>(object_.get());
}

int64_t RangeObject::Size() const {
  __int128 lo = start;
  __int128 hi = stop;
  __int128 st = step;
  if (st > 0 && lo < hi) return static_cast<int64_t>((hi - lo + st - 1) / st);
  if (st < 0 && lo > hi) return static_cast<int64_t>((lo - hi - st - 1) / -st);
  return 0;
}

Value* Dict::Find(const Value& key) {
  std::string hash;
  if (!HashKey(key, &hash))
    throw ScriptError("TypeError", "unhashable type: '" + TypeName(key) + "'");
  auto it = index_.find(hash);
  if (it == index_.end()) return nullptr;
  return &entries_[it->second].second;
}

void Dict::Set(const Value& key, Value value) {
  std::string hash;
  if (!HashKey(key, &hash))
    throw ScriptError("TypeError", "unhashable type: '" + TypeName(key) + "'");
  auto it = index_.find(hash);
  if (it != index_.end()) {
    entries_[it->second].second = std::move(value);
    return;
  }
  index_.emplace(hash, entries_.size());
  entries_.emplace_back(key, std::move(value));
}

bool Dict::Erase(const Value& key) {
  std::string hash;
  if (!HashKey(key, &hash))
    throw ScriptError("TypeError", "unhashable type: '" + TypeName(key) + "'");
  auto it = index_.find(hash);
  if (it == index_.end()) return false;
  size_t pos = it->second;
  index_.erase(it);
  entries_.erase(entries_.begin() + pos);
  for (auto& entry : index_) {
    if (entry.second > pos) entry.second--;
  }
  return true;
}

void Dict::Clear() {
  entries_.clear();
  index_.clear();
}

bool ClassObject::IsSubclassOf(const ClassObject* other) const {
  for (const ClassObject* cls = this; cls; cls = cls->base.get()) {
    if (cls == other) return true;
  }
  return false;
}

std::string ExceptionObject::Message() const {
  if (args.empty()) return "";
  if (args.size() == 1) return Str(args[0]);
  return Repr(Value::Tuple(args));
}

Value MakeNative(std::string name, NativeFn fn) {
  return Value::FromObject(
      Type::kNative, std::make_shared<NativeObject>(std::move(name), std::move(fn)));
}

Value MakeType(std::string name, NativeFn fn) {
  return Value::FromObject(
      Type::kNative,
      std::make_shared<NativeObject>(std::move(name), std::move(fn), true));
}

std::string TypeName(const Value& value) {
  switch (value.type()) {
    case Type::kNone:
      return "NoneType";
    case Type::kBool:
      return "bool";
    case Type::kInt:
      return "int";
    case Type::kFloat:
      return "float";
    case Type::kStr:
      return "str";
    case Type::kList:
      return "list";
    case Type::kTuple:
      return "tuple";
    case Type::kDict:
      return "dict";
    case Type::kRange:
      return "range";
    case Type::kFunction:
      return "function";
    case Type::kNative:
      return value.object<NativeObject>()->is_type
                 ? "type"
                 : "builtin_function_or_method";
    case Type::kModule:
      return "module";
    case Type::kClass:
      return "type";
    case Type::kException:
      return value.object<ExceptionObject>()->cls->name;
  }
  return "object";
}

bool Truthy(const Value& value) {
  switch (value.type()) {
    case Type::kNone:
      return false;
    case Type::kBool:
    case Type::kInt:
      return value.int_value() != 0;
    case Type::kFloat:
      return value.float_value() != 0;
    case Type::kStr:
      return !value.str().empty();
    case Type::kList:
    case Type::kTuple:
      return !value.items().empty();
    case Type::kDict:
      return value.dict().size() != 0;
    case Type::kRange:
      return value.range().Size() != 0;
    default:
      return true;
  }
}

bool Equals(const Value& a, const Value& b) { return EqualsImpl(a, b, 0); }

std::string Repr(const Value& value) {
  std::vector<const Object*> path;
  return ReprImpl(value, &path);
}

std::string Str(const Value& value) {
  switch (value.type()) {
    case Type::kStr:
      return value.str();
    case Type::kException:
      return value.object<ExceptionObject>()->Message();
    default:
      return Repr(value);
  }
}

std::string FloatRepr(double value) {
  if (std::isnan(value)) return "nan";
  if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
  if (value == 0) return std::signbit(value) ? "-0.0" : "0.0";
  char buf[64];
  for (int precision = 0; precision < 17; precision++) {
    snprintf(buf, sizeof(buf), "%.*e", precision, value);
    if (strtod(buf, nullptr) == value) break;
  }
  // buf is now [-]D[.DDD]e(+|-)XX with the shortest round-tripping mantissa.
  std::string repr = buf;
  std::string sign;
  if (repr[0] == '-') {
    sign = "-";
    repr = repr.substr(1);
  }
  size_t e = repr.find('e');
  int exponent = atoi(repr.c_str() + e + 1);
  std::string digits;
  for (size_t i = 0; i < e; i++) {
    if (repr[i] != '.') digits += repr[i];
  }
  if (exponent < -4 || exponent >= 16) {
    std::string out = sign + digits.substr(0, 1);
    if (digits.size() > 1) out += "." + digits.substr(1);
    char exp_buf[16];
    snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+',
             abs(exponent));
    return out + exp_buf;
  }
  if (exponent < 0) {
    return sign + "0." + std::string(-exponent - 1, '0') + digits;
  }
  if (digits.size() <= static_cast<size_t>(exponent) + 1) {
    digits += std::string(exponent + 1 - digits.size(), '0');
    return sign + digits + ".0";
  }
  return sign + digits.substr(0, exponent + 1) + "." +
         digits.substr(exponent + 1);
}

bool HashKey(const Value& value, std::string* key) {
  switch (value.type()) {
    case Type::kNone:
      *key = "N";
      return true;
    case Type::kBool:
    case Type::kInt:
      *key = absl::StrCat("i", value.int_value());
      return true;
    case Type::kFloat: {
      double f = value.float_value();
      if (f == std::floor(f) && f >= -9.2e18 && f <= 9.2e18) {
        *key = absl::StrCat("i", static_cast<int64_t>(f));
      } else {
        *key = "f" + FloatRepr(f);
      }
      return true;
    }
    case Type::kStr:
      *key = absl::StrCat("s", value.str().size(), ":", value.str());
      return true;
    case Type::kTuple: {
      std::string out = "t(";
      for (const Value& item : value.items()) {
        std::string item_key;
        if (!HashKey(item, &item_key)) return false;
        absl::StrAppend(&out, item_key.size(), ":", item_key);
      }
      *key = out + ")";
      return true;
    }
    default:
      return false;
  }
}

int64_t SizeEstimate(const Value& value) {
  switch (value.type()) {
    case Type::kNone:
      return 16;
    case Type::kBool:
    case Type::kInt:
      return 28;
    case Type::kFloat:
      return 24;
    case Type::kStr:
      return 49 + value.str().size();
    case Type::kList:
      return 56 + 8 * value.items().size();
    case Type::kTuple:
      return 40 + 8 * value.items().size();
    case Type::kDict:
      return 64 + 24 * value.dict().size();
    default:
      return 64;
  }
}

}  // namespace script
