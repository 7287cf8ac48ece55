#include <algorithm>
#include <cmath>
#include <map>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "script/format.hpp"
#include "script/interpreter.hpp"

namespace script {

namespace {

using Method = Value (*)(Interpreter*, const Value&, CallArgs*);
using MethodTable = std::map<std::string, Method>;

ScriptError TypeError(const std::string& msg) {
  return ScriptError("TypeError", msg);
}

const std::string& StrArg(const CallArgs& args, size_t position,
                          const char* name, const char* function) {
  const Value* value = args.Get(position, name);
  if (!value || !value->is_str()) {
    throw TypeError(absl::StrCat(function, "() argument must be str, not ",
                                 value ? TypeName(*value) : "None"));
  }
  return value->str();
}

bool IsAscii(const std::string& s) {
  for (unsigned char c : s) {
    if (c >= 0x80) return false;
  }
  return true;
}

// Byte offset of the code point with the given index, clamped to the end.
size_t ByteOffset(const std::string& s, int64_t index) {
  size_t pos = 0;
  for (int64_t i = 0; i < index && pos < s.size(); i++) {
    pos++;
    while (pos < s.size() && (static_cast<unsigned char>(s[pos]) & 0xc0) == 0x80)
      pos++;
  }
  return pos;
}

// Resolves the optional start and end arguments of find() and friends to
// byte offsets.
void Bounds(const std::string& s, const CallArgs& args, size_t first,
            size_t* start, size_t* end) {
  int64_t length = CodePointCount(s);
  int64_t lo = 0;
  int64_t hi = length;
  const Value* start_arg = args.Get(first, "start");
  const Value* end_arg = args.Get(first + 1, "end");
  if (start_arg && !start_arg->is_none()) {
    lo = ToIndex(*start_arg, "slice indices must be integers");
    if (lo < 0) lo = std::max<int64_t>(0, lo + length);
  }
  if (end_arg && !end_arg->is_none()) {
    hi = ToIndex(*end_arg, "slice indices must be integers");
    if (hi < 0) hi = std::max<int64_t>(0, hi + length);
  }
  hi = std::min(hi, length);
  *start = ByteOffset(s, lo);
  *end = std::max(*start, ByteOffset(s, hi));
}

Value FindImpl(const Value& self, CallArgs* args, const char* function,
               bool reverse, bool raise) {
  args->Check(function, 1, 3);
  const std::string& s = self.str();
  const std::string& sub = StrArg(*args, 0, nullptr, function);
  size_t start, end;
  Bounds(s, *args, 1, &start, &end);
  std::string window = s.substr(start, end - start);
  size_t pos = reverse ? window.rfind(sub) : window.find(sub);
  if (pos == std::string::npos) {
    if (raise) throw ScriptError("ValueError", "substring not found");
    return Value::Int(-1);
  }
  return Value::Int(CodePointCount(s.substr(0, start + pos)));
}

Value StrFind(Interpreter*, const Value& self, CallArgs* args) {
  return FindImpl(self, args, "find", false, false);
}

Value StrRfind(Interpreter*, const Value& self, CallArgs* args) {
  return FindImpl(self, args, "rfind", true, false);
}

Value StrIndex(Interpreter*, const Value& self, CallArgs* args) {
  return FindImpl(self, args, "index", false, true);
}

Value StrRindex(Interpreter*, const Value& self, CallArgs* args) {
  return FindImpl(self, args, "rindex", true, true);
}

Value StrCount(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("count", 1, 3);
  const std::string& s = self.str();
  const std::string& sub = StrArg(*args, 0, nullptr, "count");
  size_t start, end;
  Bounds(s, *args, 1, &start, &end);
  std::string window = s.substr(start, end - start);
  if (sub.empty()) return Value::Int(CodePointCount(window) + 1);
  int64_t count = 0;
  for (size_t pos = window.find(sub); pos != std::string::npos;
       pos = window.find(sub, pos + sub.size()))
    count++;
  return Value::Int(count);
}

Value StrUpper(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("upper", 0, 0);
  return Value::Str(absl::AsciiStrToUpper(self.str()));
}

Value StrLower(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("lower", 0, 0);
  return Value::Str(absl::AsciiStrToLower(self.str()));
}

Value StrSwapcase(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("swapcase", 0, 0);
  std::string out = self.str();
  for (char& c : out) {
    if (absl::ascii_isupper(c)) {
      c = absl::ascii_tolower(c);
    } else if (absl::ascii_islower(c)) {
      c = absl::ascii_toupper(c);
    }
  }
  return Value::Str(std::move(out));
}

Value StrCapitalize(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("capitalize", 0, 0);
  std::string out = absl::AsciiStrToLower(self.str());
  if (!out.empty()) out[0] = absl::ascii_toupper(out[0]);
  return Value::Str(std::move(out));
}

Value StrTitle(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("title", 0, 0);
  std::string out = self.str();
  bool previous_cased = false;
  for (char& c : out) {
    if (absl::ascii_isalpha(c)) {
      c = previous_cased ? absl::ascii_tolower(c) : absl::ascii_toupper(c);
      previous_cased = true;
    } else {
      previous_cased = false;
    }
  }
  return Value::Str(std::move(out));
}

Value StripImpl(const Value& self, CallArgs* args, const char* function,
                bool left, bool right) {
  args->Check(function, 0, 1);
  const std::string& s = self.str();
  std::string chars = " \t\n\r\f\v";
  const Value* arg = args->Get(0, nullptr);
  if (arg && !arg->is_none()) chars = StrArg(*args, 0, nullptr, function);
  size_t start = 0;
  size_t end = s.size();
  if (left) {
    start = s.find_first_not_of(chars);
    if (start == std::string::npos) return Value::Str("");
  }
  if (right) {
    size_t last = s.find_last_not_of(chars);
    if (last == std::string::npos) return Value::Str("");
    end = last + 1;
  }
  return Value::Str(s.substr(start, end - start));
}

Value StrStrip(Interpreter*, const Value& self, CallArgs* args) {
  return StripImpl(self, args, "strip", true, true);
}

Value StrLstrip(Interpreter*, const Value& self, CallArgs* args) {
  return StripImpl(self, args, "lstrip", true, false);
}

Value StrRstrip(Interpreter*, const Value& self, CallArgs* args) {
  return StripImpl(self, args, "rstrip", false, true);
}

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

std::vector<Value> SplitWhitespace(const std::string& s, int64_t maxsplit,
                                   bool reverse) {
  std::vector<std::string> parts;
  if (!reverse) {
    size_t i = 0;
    while (true) {
      while (i < s.size() && IsSpace(s[i])) i++;
      if (i >= s.size()) break;
      if (maxsplit >= 0 && static_cast<int64_t>(parts.size()) == maxsplit) {
        parts.push_back(s.substr(i));
        break;
      }
      size_t j = i;
      while (j < s.size() && !IsSpace(s[j])) j++;
      parts.push_back(s.substr(i, j - i));
      i = j;
    }
  } else {
    size_t i = s.size();
    while (true) {
      while (i > 0 && IsSpace(s[i - 1])) i--;
      if (i == 0) break;
      if (maxsplit >= 0 && static_cast<int64_t>(parts.size()) == maxsplit) {
        parts.push_back(s.substr(0, i));
        break;
      }
      size_t j = i;
      while (j > 0 && !IsSpace(s[j - 1])) j--;
      parts.push_back(s.substr(j, i - j));
      i = j;
    }
    std::reverse(parts.begin(), parts.end());
  }
  std::vector<Value> out;
  for (std::string& part : parts) out.push_back(Value::Str(std::move(part)));
  return out;
}

Value SplitImpl(const Value& self, CallArgs* args, const char* function,
                bool reverse) {
  args->Check(function, 0, 2, {"sep", "maxsplit"});
  const std::string& s = self.str();
  int64_t maxsplit = -1;
  const Value* max_arg = args->Get(1, "maxsplit");
  if (max_arg) maxsplit = ToIndex(*max_arg, "maxsplit must be an integer");
  const Value* sep_arg = args->Get(0, "sep");
  if (!sep_arg || sep_arg->is_none())
    return Value::List(SplitWhitespace(s, maxsplit, reverse));
  const std::string& sep = StrArg(*args, 0, "sep", function);
  if (sep.empty()) throw ScriptError("ValueError", "empty separator");
  std::vector<Value> out;
  if (!reverse) {
    size_t start = 0;
    while (maxsplit < 0 || static_cast<int64_t>(out.size()) < maxsplit) {
      size_t pos = s.find(sep, start);
      if (pos == std::string::npos) break;
      out.push_back(Value::Str(s.substr(start, pos - start)));
      start = pos + sep.size();
    }
    out.push_back(Value::Str(s.substr(start)));
    return Value::List(std::move(out));
  }
  size_t end = s.size();
  while (maxsplit < 0 || static_cast<int64_t>(out.size()) < maxsplit) {
    if (end < sep.size()) break;
    size_t pos = s.rfind(sep, end - sep.size());
    if (pos == std::string::npos) break;
    out.push_back(Value::Str(s.substr(pos + sep.size(), end - pos - sep.size())));
    end = pos;
  }
  out.push_back(Value::Str(s.substr(0, end)));
  std::reverse(out.begin(), out.end());
  return Value::List(std::move(out));
}

Value StrSplit(Interpreter*, const Value& self, CallArgs* args) {
  return SplitImpl(self, args, "split", false);
}

Value StrRsplit(Interpreter*, const Value& self, CallArgs* args) {
  return SplitImpl(self, args, "rsplit", true);
}

Value StrSplitlines(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("splitlines", 0, 1, {"keepends"});
  const Value* keep_arg = args->Get(0, "keepends");
  bool keepends = keep_arg && Truthy(*keep_arg);
  const std::string& s = self.str();
  std::vector<Value> out;
  size_t start = 0;
  while (start < s.size()) {
    size_t pos = s.find_first_of("\r\n", start);
    if (pos == std::string::npos) {
      out.push_back(Value::Str(s.substr(start)));
      break;
    }
    size_t next = pos + 1;
    if (s[pos] == '\r' && next < s.size() && s[next] == '\n') next++;
    out.push_back(Value::Str(s.substr(start, (keepends ? next : pos) - start)));
    start = next;
  }
  return Value::List(std::move(out));
}

Value StrJoin(Interpreter* interpreter, const Value& self, CallArgs* args) {
  args->Check("join", 1, 1);
  std::string out;
  size_t index = 0;
  interpreter->ForEach(args->args[0], [&](const Value& item) {
    if (!item.is_str()) {
      throw TypeError(absl::StrCat("sequence item ", index,
                                   ": expected str instance, ", TypeName(item),
                                   " found"));
    }
    if (index++) out += self.str();
    out += item.str();
    return true;
  });
  return Value::Str(std::move(out));
}

Value StrReplace(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("replace", 2, 3);
  const std::string& s = self.str();
  const std::string& from = StrArg(*args, 0, nullptr, "replace");
  const std::string& to = StrArg(*args, 1, nullptr, "replace");
  int64_t count = -1;
  if (args->args.size() > 2) count = ToIndex(args->args[2], "count must be an integer");
  std::string out;
  if (from.empty()) {
    int64_t done = 0;
    std::vector<std::string> points = CodePoints(s);
    for (const std::string& point : points) {
      if (count < 0 || done < count) {
        out += to;
        done++;
      }
      out += point;
    }
    if (count < 0 || done < count) out += to;
    return Value::Str(std::move(out));
  }
  size_t start = 0;
  int64_t done = 0;
  while (count < 0 || done < count) {
    size_t pos = s.find(from, start);
    if (pos == std::string::npos) break;
    out += s.substr(start, pos - start) + to;
    start = pos + from.size();
    done++;
  }
  out += s.substr(start);
  return Value::Str(std::move(out));
}

// Applies fn to a str argument or to each str in a tuple argument.
template <typename Fn>
bool AnyAffix(const Value& affix, const char* function, Fn fn) {
  if (affix.is_tuple()) {
    for (const Value& item : affix.items()) {
      if (!item.is_str())
        throw TypeError(absl::StrCat(
            "tuple for ", function, " must only contain str, not ",
            TypeName(item)));
      if (fn(item.str())) return true;
    }
    return false;
  }
  if (!affix.is_str())
    throw TypeError(absl::StrCat(function,
                                 " first arg must be str or a tuple of str, "
                                 "not ",
                                 TypeName(affix)));
  return fn(affix.str());
}

Value StrStartswith(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("startswith", 1, 3);
  size_t start, end;
  Bounds(self.str(), *args, 1, &start, &end);
  std::string window = self.str().substr(start, end - start);
  return Value::Bool(AnyAffix(args->args[0], "startswith",
                              [&window](const std::string& prefix) {
                                return absl::StartsWith(window, prefix);
                              }));
}

Value StrEndswith(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("endswith", 1, 3);
  size_t start, end;
  Bounds(self.str(), *args, 1, &start, &end);
  std::string window = self.str().substr(start, end - start);
  return Value::Bool(AnyAffix(args->args[0], "endswith",
                              [&window](const std::string& suffix) {
                                return absl::EndsWith(window, suffix);
                              }));
}

Value StrRemoveprefix(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("removeprefix", 1, 1);
  const std::string& prefix = StrArg(*args, 0, nullptr, "removeprefix");
  if (absl::StartsWith(self.str(), prefix))
    return Value::Str(self.str().substr(prefix.size()));
  return self;
}

Value StrRemovesuffix(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("removesuffix", 1, 1);
  const std::string& suffix = StrArg(*args, 0, nullptr, "removesuffix");
  if (!suffix.empty() && absl::EndsWith(self.str(), suffix))
    return Value::Str(self.str().substr(0, self.str().size() - suffix.size()));
  return self;
}

template <bool (*Pred)(unsigned char)>
Value AllChars(const Value& self, CallArgs* args, const char* function) {
  args->Check(function, 0, 0);
  const std::string& s = self.str();
  if (s.empty()) return Value::Bool(false);
  for (unsigned char c : s) {
    if (!Pred(c)) return Value::Bool(false);
  }
  return Value::Bool(true);
}

bool Digit(unsigned char c) { return absl::ascii_isdigit(c); }
bool Alpha(unsigned char c) { return absl::ascii_isalpha(c); }
bool Alnum(unsigned char c) { return absl::ascii_isalnum(c); }
bool Space(unsigned char c) { return absl::ascii_isspace(c); }

Value StrIsdigit(Interpreter*, const Value& self, CallArgs* args) {
  return AllChars<Digit>(self, args, "isdigit");
}

Value StrIsalpha(Interpreter*, const Value& self, CallArgs* args) {
  return AllChars<Alpha>(self, args, "isalpha");
}

Value StrIsalnum(Interpreter*, const Value& self, CallArgs* args) {
  return AllChars<Alnum>(self, args, "isalnum");
}

Value StrIsspace(Interpreter*, const Value& self, CallArgs* args) {
  return AllChars<Space>(self, args, "isspace");
}

// isupper/islower: at least one cased character and none of the other case.
Value CaseCheck(const Value& self, CallArgs* args, const char* function,
                bool upper) {
  args->Check(function, 0, 0);
  bool cased = false;
  for (char c : self.str()) {
    if (upper ? absl::ascii_islower(c) : absl::ascii_isupper(c))
      return Value::Bool(false);
    if (absl::ascii_isalpha(c)) cased = true;
  }
  return Value::Bool(cased);
}

Value StrIsupper(Interpreter*, const Value& self, CallArgs* args) {
  return CaseCheck(self, args, "isupper", true);
}

Value StrIslower(Interpreter*, const Value& self, CallArgs* args) {
  return CaseCheck(self, args, "islower", false);
}

Value PadImpl(const Value& self, CallArgs* args, const char* function,
              char align) {
  args->Check(function, 1, 2);
  int64_t width = ToIndex(args->args[0], "width must be an integer");
  std::string fill = " ";
  if (args->args.size() > 1) {
    fill = StrArg(*args, 1, nullptr, function);
    if (CodePointCount(fill) != 1)
      throw TypeError("The fill character must be exactly one character long");
  }
  int64_t length = CodePointCount(self.str());
  if (width <= length) return self;
  int64_t total = width - length;
  int64_t left = align == '<' ? 0 : align == '>' ? total : total / 2;
  // str.center puts the extra character on the right for odd padding
  // unless the string length is odd.
  if (align == '^' && (total % 2) && (length % 2)) left++;
  std::string out;
  for (int64_t i = 0; i < left; i++) out += fill;
  out += self.str();
  for (int64_t i = left; i < total; i++) out += fill;
  return Value::Str(std::move(out));
}

Value StrCenter(Interpreter*, const Value& self, CallArgs* args) {
  return PadImpl(self, args, "center", '^');
}

Value StrLjust(Interpreter*, const Value& self, CallArgs* args) {
  return PadImpl(self, args, "ljust", '<');
}

Value StrRjust(Interpreter*, const Value& self, CallArgs* args) {
  return PadImpl(self, args, "rjust", '>');
}

Value StrZfill(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("zfill", 1, 1);
  int64_t width = ToIndex(args->args[0], "width must be an integer");
  const std::string& s = self.str();
  int64_t length = CodePointCount(s);
  if (width <= length) return self;
  size_t sign = !s.empty() && (s[0] == '-' || s[0] == '+') ? 1 : 0;
  return Value::Str(s.substr(0, sign) + std::string(width - length, '0') +
                    s.substr(sign));
}

Value PartitionImpl(const Value& self, CallArgs* args, const char* function,
                    bool reverse) {
  args->Check(function, 1, 1);
  const std::string& s = self.str();
  const std::string& sep = StrArg(*args, 0, nullptr, function);
  if (sep.empty()) throw ScriptError("ValueError", "empty separator");
  size_t pos = reverse ? s.rfind(sep) : s.find(sep);
  if (pos == std::string::npos) {
    if (reverse)
      return Value::Tuple({Value::Str(""), Value::Str(""), self});
    return Value::Tuple({self, Value::Str(""), Value::Str("")});
  }
  return Value::Tuple({Value::Str(s.substr(0, pos)), Value::Str(sep),
                       Value::Str(s.substr(pos + sep.size()))});
}

Value StrPartition(Interpreter*, const Value& self, CallArgs* args) {
  return PartitionImpl(self, args, "partition", false);
}

Value StrRpartition(Interpreter*, const Value& self, CallArgs* args) {
  return PartitionImpl(self, args, "rpartition", true);
}

Value StrFormatMethod(Interpreter* interpreter, const Value& self,
                      CallArgs* args) {
  return Value::Str(FormatString(interpreter, self.str(), *args));
}

const MethodTable& StrMethods() {
  static const MethodTable* table = new MethodTable{
      {"capitalize", StrCapitalize}, {"casefold", StrLower},
      {"center", StrCenter},         {"count", StrCount},
      {"endswith", StrEndswith},     {"find", StrFind},
      {"format", StrFormatMethod},   {"index", StrIndex},
      {"isalnum", StrIsalnum},       {"isalpha", StrIsalpha},
      {"isdecimal", StrIsdigit},     {"isdigit", StrIsdigit},
      {"islower", StrIslower},       {"isnumeric", StrIsdigit},
      {"isspace", StrIsspace},       {"isupper", StrIsupper},
      {"join", StrJoin},             {"ljust", StrLjust},
      {"lower", StrLower},           {"lstrip", StrLstrip},
      {"partition", StrPartition},   {"removeprefix", StrRemoveprefix},
      {"removesuffix", StrRemovesuffix}, {"replace", StrReplace},
      {"rfind", StrRfind},           {"rindex", StrRindex},
      {"rjust", StrRjust},           {"rpartition", StrRpartition},
      {"rsplit", StrRsplit},         {"rstrip", StrRstrip},
      {"split", StrSplit},           {"splitlines", StrSplitlines},
      {"startswith", StrStartswith}, {"strip", StrStrip},
      {"swapcase", StrSwapcase},     {"title", StrTitle},
      {"upper", StrUpper},           {"zfill", StrZfill}};
  return *table;
}

Value ListAppend(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("append", 1, 1);
  self.items().push_back(args->args[0]);
  return Value::None();
}

Value ListExtend(Interpreter* interpreter, const Value& self, CallArgs* args) {
  args->Check("extend", 1, 1);
  std::vector<Value> extra = interpreter->ToVector(args->args[0]);
  self.items().insert(self.items().end(), extra.begin(), extra.end());
  return Value::None();
}

Value ListInsert(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("insert", 2, 2);
  std::vector<Value>& items = self.items();
  int64_t size = items.size();
  int64_t index = ToIndex(args->args[0], "list indices must be integers");
  if (index < 0) index = std::max<int64_t>(0, index + size);
  index = std::min(index, size);
  items.insert(items.begin() + index, args->args[1]);
  return Value::None();
}

Value ListPop(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("pop", 0, 1);
  std::vector<Value>& items = self.items();
  if (items.empty()) throw ScriptError("IndexError", "pop from empty list");
  int64_t index = -1;
  if (!args->args.empty())
    index = ToIndex(args->args[0], "list indices must be integers");
  index = NormalizeIndex(index, items.size(), "pop");
  Value value = items[index];
  items.erase(items.begin() + index);
  return value;
}

Value ListRemove(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("remove", 1, 1);
  std::vector<Value>& items = self.items();
  for (size_t i = 0; i < items.size(); i++) {
    if (Equals(items[i], args->args[0])) {
      items.erase(items.begin() + i);
      return Value::None();
    }
  }
  throw ScriptError("ValueError", "list.remove(x): x not in list");
}

Value SeqIndex(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("index", 1, 3);
  const std::vector<Value>& items = self.items();
  int64_t size = items.size();
  int64_t start = 0;
  int64_t stop = size;
  if (args->args.size() > 1) {
    start = ToIndex(args->args[1], "slice indices must be integers");
    if (start < 0) start = std::max<int64_t>(0, start + size);
  }
  if (args->args.size() > 2) {
    stop = ToIndex(args->args[2], "slice indices must be integers");
    if (stop < 0) stop = std::max<int64_t>(0, stop + size);
  }
  for (int64_t i = start; i < std::min(stop, size); i++) {
    if (Equals(items[i], args->args[0])) return Value::Int(i);
  }
  throw ScriptError("ValueError",
                    Repr(args->args[0]) + " is not in " + TypeName(self));
}

Value SeqCount(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("count", 1, 1);
  int64_t count = 0;
  for (const Value& item : self.items()) {
    if (Equals(item, args->args[0])) count++;
  }
  return Value::Int(count);
}

Value ListSort(Interpreter* interpreter, const Value& self, CallArgs* args) {
  args->Check("sort", 0, 0, {"key", "reverse"});
  const Value* key = args->Get(99, "key");
  const Value* reverse = args->Get(99, "reverse");
  SortValues(interpreter, &self.items(), key ? *key : Value::None(),
             reverse && Truthy(*reverse));
  return Value::None();
}

Value ListReverse(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("reverse", 0, 0);
  std::reverse(self.items().begin(), self.items().end());
  return Value::None();
}

Value ListCopy(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("copy", 0, 0);
  return Value::List(self.items());
}

Value ListClear(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("clear", 0, 0);
  self.items().clear();
  return Value::None();
}

const MethodTable& ListMethods() {
  static const MethodTable* table = new MethodTable{
      {"append", ListAppend}, {"clear", ListClear},     {"copy", ListCopy},
      {"count", SeqCount},    {"extend", ListExtend},   {"index", SeqIndex},
      {"insert", ListInsert}, {"pop", ListPop},         {"remove", ListRemove},
      {"reverse", ListReverse}, {"sort", ListSort}};
  return *table;
}

const MethodTable& TupleMethods() {
  static const MethodTable* table =
      new MethodTable{{"count", SeqCount}, {"index", SeqIndex}};
  return *table;
}

Value DictGet(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("get", 1, 2);
  Value* value = self.dict().Find(args->args[0]);
  if (value) return *value;
  return args->args.size() > 1 ? args->args[1] : Value::None();
}

Value DictKeys(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("keys", 0, 0);
  std::vector<Value> out;
  for (const auto& entry : self.dict().entries()) out.push_back(entry.first);
  return Value::List(std::move(out));
}

Value DictValues(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("values", 0, 0);
  std::vector<Value> out;
  for (const auto& entry : self.dict().entries()) out.push_back(entry.second);
  return Value::List(std::move(out));
}

Value DictItems(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("items", 0, 0);
  std::vector<Value> out;
  for (const auto& entry : self.dict().entries())
    out.push_back(Value::Tuple({entry.first, entry.second}));
  return Value::List(std::move(out));
}

Value DictPop(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("pop", 1, 2);
  Value* value = self.dict().Find(args->args[0]);
  if (!value) {
    if (args->args.size() > 1) return args->args[1];
    throw ScriptError("KeyError", Repr(args->args[0]));
  }
  Value result = *value;
  self.dict().Erase(args->args[0]);
  return result;
}

Value DictPopitem(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("popitem", 0, 0);
  if (self.dict().size() == 0)
    throw ScriptError("KeyError", "'popitem(): dictionary is empty'");
  auto entry = self.dict().entries().back();
  self.dict().Erase(entry.first);
  return Value::Tuple({entry.first, entry.second});
}

Value DictSetdefault(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("setdefault", 1, 2);
  Value* value = self.dict().Find(args->args[0]);
  if (value) return *value;
  Value fallback = args->args.size() > 1 ? args->args[1] : Value::None();
  self.dict().Set(args->args[0], fallback);
  return fallback;
}

Value DictUpdate(Interpreter* interpreter, const Value& self, CallArgs* args) {
  if (args->args.size() > 1)
    throw TypeError("update expected at most 1 argument");
  if (!args->args.empty()) {
    const Value& other = args->args[0];
    if (other.is_dict()) {
      for (const auto& entry : other.dict().entries())
        self.dict().Set(entry.first, entry.second);
    } else {
      interpreter->ForEach(other, [&](const Value& pair) {
        std::vector<Value> kv = interpreter->ToVector(pair);
        if (kv.size() != 2)
          throw ScriptError("ValueError",
                            "dictionary update sequence element has wrong "
                            "length");
        self.dict().Set(kv[0], kv[1]);
        return true;
      });
    }
  }
  for (const auto& kwarg : args->kwargs)
    self.dict().Set(Value::Str(kwarg.first), kwarg.second);
  return Value::None();
}

Value DictCopy(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("copy", 0, 0);
  Value copy = Value::NewDict();
  for (const auto& entry : self.dict().entries())
    copy.dict().Set(entry.first, entry.second);
  return copy;
}

Value DictClear(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("clear", 0, 0);
  self.dict().Clear();
  return Value::None();
}

const MethodTable& DictMethods() {
  static const MethodTable* table = new MethodTable{
      {"clear", DictClear},   {"copy", DictCopy},
      {"get", DictGet},       {"items", DictItems},
      {"keys", DictKeys},     {"pop", DictPop},
      {"popitem", DictPopitem}, {"setdefault", DictSetdefault},
      {"update", DictUpdate}, {"values", DictValues}};
  return *table;
}

Value FloatIsInteger(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("is_integer", 0, 0);
  double f = self.float_value();
  return Value::Bool(std::isfinite(f) && f == std::floor(f));
}

Value IntBitLength(Interpreter*, const Value& self, CallArgs* args) {
  args->Check("bit_length", 0, 0);
  uint64_t v = self.int_value() < 0 ? -static_cast<uint64_t>(self.int_value())
                                    : self.int_value();
  int64_t bits = 0;
  while (v) {
    bits++;
    v >>= 1;
  }
  return Value::Int(bits);
}

}  // namespace

bool LookupMethod(const Value& self, const std::string& name, Value* method) {
  const MethodTable* table = nullptr;
  static const MethodTable* float_methods =
      new MethodTable{{"is_integer", FloatIsInteger}};
  static const MethodTable* int_methods =
      new MethodTable{{"bit_length", IntBitLength}};
  switch (self.type()) {
    case Type::kStr:
      table = &StrMethods();
      break;
    case Type::kList:
      table = &ListMethods();
      break;
    case Type::kTuple:
      table = &TupleMethods();
      break;
    case Type::kDict:
      table = &DictMethods();
      break;
    case Type::kFloat:
      table = float_methods;
      break;
    case Type::kInt:
    case Type::kBool:
      table = int_methods;
      break;
    default:
      return false;
  }
  auto it = table->find(name);
  if (it == table->end()) return false;
  Method fn = it->second;
  *method = MakeNative(name, [self, fn](Interpreter* interpreter,
                                        CallArgs* args) {
    return fn(interpreter, self, args);
  });
  return true;
}

void SortValues(Interpreter* interpreter, std::vector<Value>* items,
                const Value& key, bool reverse) {
  std::vector<Value> keys;
  keys.reserve(items->size());
  for (const Value& item : *items) {
    if (key.is_none()) {
      keys.push_back(item);
    } else {
      CallArgs args;
      args.args.push_back(item);
      keys.push_back(interpreter->Call(key, std::move(args)));
    }
  }
  std::vector<size_t> order(items->size());
  for (size_t i = 0; i < order.size(); i++) order[i] = i;
  // Sorting a permutation keeps items intact if a comparison throws.
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) {
                     return reverse ? interpreter->Less(keys[b], keys[a])
                                    : interpreter->Less(keys[a], keys[b]);
                   });
  std::vector<Value> sorted;
  sorted.reserve(order.size());
  for (size_t i : order) sorted.push_back((*items)[i]);
  *items = std::move(sorted);
}

int64_t ToIndex(const Value& value, const char* what) {
  if (value.is_int() || value.is_bool()) return value.int_value();
  throw TypeError(absl::StrCat(what, ", not ", TypeName(value)));
}

int64_t NormalizeIndex(int64_t index, int64_t size, const char* type_name) {
  if (index < 0) index += size;
  if (index < 0 || index >= size)
    throw ScriptError("IndexError", absl::StrCat(type_name, " index out of range"));
  return index;
}

void AdjustSlice(const Value& lower, const Value& upper, const Value& step,
                 int64_t size, int64_t* start, int64_t* stop,
                 int64_t* stride) {
  *stride = step.is_none() ? 1 : ToIndex(step, "slice indices must be integers or None");
  if (*stride == 0) throw ScriptError("ValueError", "slice step cannot be zero");
  auto adjust = [size, stride](const Value& bound, int64_t fallback) {
    if (bound.is_none()) return fallback;
    int64_t i = ToIndex(bound, "slice indices must be integers or None");
    if (i < 0) {
      i += size;
      if (i < 0) i = *stride < 0 ? -1 : 0;
    } else if (i >= size) {
      i = *stride < 0 ? size - 1 : size;
    }
    return i;
  };
  *start = adjust(lower, *stride < 0 ? size - 1 : 0);
  *stop = adjust(upper, *stride < 0 ? -1 : size);
}

std::vector<int64_t> SliceIndices(const Value& lower, const Value& upper,
                                  const Value& step, int64_t size) {
  int64_t start, stop, stride;
  AdjustSlice(lower, upper, step, size, &start, &stop, &stride);
  std::vector<int64_t> indices;
  for (int64_t i = start; stride > 0 ? i < stop : i > stop; i += stride)
    indices.push_back(i);
  return indices;
}

std::vector<std::string> CodePoints(const std::string& s) {
  std::vector<std::string> points;
  size_t i = 0;
  while (i < s.size()) {
    size_t j = i + 1;
    while (j < s.size() && (static_cast<unsigned char>(s[j]) & 0xc0) == 0x80) j++;
    points.push_back(s.substr(i, j - i));
    i = j;
  }
  return points;
}

int64_t CodePointCount(const std::string& s) {
  if (IsAscii(s)) return s.size();
  int64_t count = 0;
  for (unsigned char c : s) {
    if ((c & 0xc0) != 0x80) count++;
  }
  return count;
}

}  // namespace script
