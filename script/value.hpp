#ifndef SCRIPT_VALUE_HPP
#define SCRIPT_VALUE_HPP

#include <stdint.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace script {

class Interpreter;
struct CallArgs;

enum class Type {
  kNone,
  kBool,
  kInt,
  kFloat,
  kStr,
  kList,
  kTuple,
  kDict,
  kRange,
  kFunction,
  kNative,
  kModule,
  kClass,
  kException
};

class Object {
 public:
  virtual ~Object() = default;
};

class Dict;
struct RangeObject;

// A dynamically typed script value. Scalars are stored inline; containers
// and callables are shared, so copying a Value aliases the same list or dict
// like a Python reference does.
class Value {
 public:
  Value() = default;

  static Value None() { return Value(); }
  static Value Bool(bool b);
  static Value Int(int64_t i);
  static Value Float(double f);
  static Value Str(std::string s);
  static Value List(std::vector<Value> items = {});
  static Value Tuple(std::vector<Value> items = {});
  static Value NewDict();
  static Value Range(int64_t start, int64_t stop, int64_t step);
  static Value FromObject(Type type, std::shared_ptr<Object> object);

  Type type() const { return type_; }
  bool is_none() const { return type_ == Type::kNone; }
  bool is_bool() const { return type_ == Type::kBool; }
  bool is_int() const { return type_ == Type::kInt; }
  bool is_float() const { return type_ == Type::kFloat; }
  // bool, int or float.
  bool is_number() const {
    return type_ == Type::kBool || type_ == Type::kInt ||
           type_ == Type::kFloat;
  }
  bool is_str() const { return type_ == Type::kStr; }
  bool is_list() const { return type_ == Type::kList; }
  bool is_tuple() const { return type_ == Type::kTuple; }
  bool is_dict() const { return type_ == Type::kDict; }

  bool bool_value() const { return int_ != 0; }
  // Valid for bool and int.
  int64_t int_value() const { return int_; }
  double float_value() const { return float_; }
  // Numeric value as a double, for bool, int and float.
  double AsDouble() const {
    return type_ == Type::kFloat ? float_ : static_cast<double>(int_);
  }

  const std::string& str() const;
  // Elements of a list or a tuple.
  std::vector<Value>& items() const;
  Dict& dict() const;
  const RangeObject& range() const;

  template <typename T>
  T* object() const {
    return static_cast<T*>(object_.get());
  }
  const Object* identity() const { return object_.get(); }

 private:
  Type type_ = Type::kNone;
  int64_t int_ = 0;
  double float_ = 0;
  std::shared_ptr<Object> object_;
};

struct StrObject : public Object {
  explicit StrObject(std::string v) : value(std::move(v)) {}
  std::string value;
};

struct SeqObject : public Object {
  explicit SeqObject(std::vector<Value> v) : items(std::move(v)) {}
  std::vector<Value> items;
};

struct RangeObject : public Object {
  RangeObject(int64_t start, int64_t stop, int64_t step)
      : start(start), stop(stop), step(step) {}
  int64_t Size() const;
  int64_t At(int64_t index) const { return start + index * step; }
  int64_t start;
  int64_t stop;
  int64_t step;
};

// Insertion-ordered dictionary. Keys must be hashable: None, bool, int,
// float, str or tuples of those.
class Dict : public Object {
 public:
  // Returns nullptr if the key is missing. Throws ScriptError(TypeError) for
  // unhashable keys.
  Value* Find(const Value& key);
  void Set(const Value& key, Value value);
  bool Erase(const Value& key);
  void Clear();
  size_t size() const { return entries_.size(); }
  const std::vector<std::pair<Value, Value>>& entries() const {
    return entries_;
  }

 private:
  std::vector<std::pair<Value, Value>> entries_;
  std::unordered_map<std::string, size_t> index_;
};

// A function defined by the script; the interpreter subclasses it.
struct FunctionObject : public Object {
  explicit FunctionObject(std::string name) : name(std::move(name)) {}
  std::string name;
};

using NativeFn = std::function<Value(Interpreter*, CallArgs*)>;

struct NativeObject : public Object {
  NativeObject(std::string name, NativeFn fn, bool is_type = false)
      : name(std::move(name)), fn(std::move(fn)), is_type(is_type) {}
  std::string name;
  NativeFn fn;
  // Builtin types (int, str, ...) are natives that convert their argument.
  bool is_type;
};

struct ModuleObject : public Object {
  explicit ModuleObject(std::string name) : name(std::move(name)) {}
  std::string name;
  std::map<std::string, Value> attributes;
};

// An exception class. Classes form a single-inheritance tree rooted at
// BaseException.
struct ClassObject : public Object {
  ClassObject(std::string name, std::shared_ptr<ClassObject> base)
      : name(std::move(name)), base(std::move(base)) {}
  bool IsSubclassOf(const ClassObject* other) const;
  std::string name;
  std::shared_ptr<ClassObject> base;
};

struct ExceptionObject : public Object {
  ExceptionObject(std::shared_ptr<ClassObject> cls, std::vector<Value> args)
      : cls(std::move(cls)), args(std::move(args)) {}
  std::string Message() const;
  std::shared_ptr<ClassObject> cls;
  std::vector<Value> args;
};

Value MakeNative(std::string name, NativeFn fn);
Value MakeType(std::string name, NativeFn fn);

// Python type name of a value, e.g. "int" or "NoneType".
std::string TypeName(const Value& value);

bool Truthy(const Value& value);

// Structural equality with Python semantics (1 == 1.0 == True).
bool Equals(const Value& a, const Value& b);

// The repr() and str() of a value.
std::string Repr(const Value& value);
std::string Str(const Value& value);

// Shortest representation of a double that reads back to the same value.
std::string FloatRepr(double value);

// Computes a key such that equal hashable values get equal keys. Returns
// false for unhashable values.
bool HashKey(const Value& value, std::string* key);

// Rough number of bytes used by a value, in the spirit of sys.getsizeof.
int64_t SizeEstimate(const Value& value);

}  // namespace script

#endif
