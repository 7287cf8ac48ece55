#include "script/format.hpp"

#include <stdio.h>

#include <cmath>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "script/interpreter.hpp"

namespace script {

namespace {

struct Spec {
  std::string fill = " ";
  char align = 0;
  char sign = '-';
  bool alternate = false;
  bool zero = false;
  int64_t width = -1;
  char grouping = 0;
  int precision = -1;
  char type = 0;
};

ScriptError InvalidSpec() {
  return ScriptError("ValueError", "Invalid format specifier");
}

bool IsAlign(char c) { return c == '<' || c == '>' || c == '^' || c == '='; }

// Length in bytes of the UTF-8 sequence starting at s[i].
size_t CharLength(const std::string& s, size_t i) {
  size_t j = i + 1;
  while (j < s.size() && (static_cast<unsigned char>(s[j]) & 0xc0) == 0x80) j++;
  return j - i;
}

Spec ParseSpec(const std::string& text) {
  Spec spec;
  size_t i = 0;
  if (!text.empty()) {
    size_t first = CharLength(text, 0);
    if (first < text.size() && IsAlign(text[first])) {
      spec.fill = text.substr(0, first);
      spec.align = text[first];
      i = first + 1;
    } else if (IsAlign(text[0])) {
      spec.align = text[0];
      i = 1;
    }
  }
  if (i < text.size() &&
      (text[i] == '+' || text[i] == '-' || text[i] == ' ')) {
    spec.sign = text[i++];
  }
  if (i < text.size() && text[i] == '#') {
    spec.alternate = true;
    i++;
  }
  if (i < text.size() && text[i] == '0') {
    spec.zero = true;
    i++;
  }
  int64_t width = 0;
  bool has_width = false;
  while (i < text.size() && absl::ascii_isdigit(text[i])) {
    width = width * 10 + (text[i++] - '0');
    has_width = true;
    if (width > 100000) throw ScriptError("ValueError", "Too many decimal digits in format string");
  }
  if (has_width) spec.width = width;
  if (i < text.size() && (text[i] == ',' || text[i] == '_')) spec.grouping = text[i++];
  if (i < text.size() && text[i] == '.') {
    i++;
    int precision = 0;
    bool has_precision = false;
    while (i < text.size() && absl::ascii_isdigit(text[i])) {
      precision = precision * 10 + (text[i++] - '0');
      has_precision = true;
      if (precision > 10000) throw ScriptError("ValueError", "precision too big");
    }
    if (!has_precision) throw ScriptError("ValueError", "Format specifier missing precision");
    spec.precision = precision;
  }
  if (i < text.size()) spec.type = text[i++];
  if (i != text.size()) throw InvalidSpec();
  return spec;
}

int64_t Width(const std::string& s) {
  int64_t count = 0;
  for (unsigned char c : s) {
    if ((c & 0xc0) != 0x80) count++;
  }
  return count;
}

// Pads sign + body to the requested width.
std::string Pad(const std::string& sign, const std::string& body,
                const Spec& spec, char default_align) {
  char align = spec.align ? spec.align : default_align;
  std::string fill = spec.fill;
  if (spec.zero && !spec.align) {
    fill = "0";
    align = default_align == '<' ? '<' : '=';
  }
  int64_t total = spec.width - Width(sign) - Width(body);
  if (total <= 0) return sign + body;
  auto repeat = [&fill](int64_t n) {
    std::string out;
    for (int64_t i = 0; i < n; i++) out += fill;
    return out;
  };
  switch (align) {
    case '<':
      return sign + body + repeat(total);
    case '^':
      return repeat(total / 2) + sign + body + repeat(total - total / 2);
    case '=':
      return sign + repeat(total) + body;
    default:
      return repeat(total) + sign + body;
  }
}

std::string Group(const std::string& digits, char separator, size_t every) {
  if (!separator) return digits;
  std::string out;
  size_t n = digits.size();
  for (size_t i = 0; i < n; i++) {
    if (i && (n - i) % every == 0) out += separator;
    out += digits[i];
  }
  return out;
}

std::string SignOf(bool negative, const Spec& spec) {
  if (negative) return "-";
  if (spec.sign == '+') return "+";
  if (spec.sign == ' ') return " ";
  return "";
}

std::string FormatInt(int64_t value, const Spec& spec) {
  char type = spec.type ? spec.type : 'd';
  if (type == 'c') {
    if (value < 0 || value > 0x10ffff)
      throw ScriptError("OverflowError", "%c arg not in range(0x110000)");
    std::string out;
    uint32_t cp = value;
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
    return Pad("", out, spec, '<');
  }
  int base = 10;
  std::string prefix;
  switch (type) {
    case 'd':
    case 'n':
      break;
    case 'b':
      base = 2;
      prefix = "0b";
      break;
    case 'o':
      base = 8;
      prefix = "0o";
      break;
    case 'x':
      base = 16;
      prefix = "0x";
      break;
    case 'X':
      base = 16;
      prefix = "0X";
      break;
    default:
      throw ScriptError("ValueError",
                        absl::StrCat("Unknown format code '",
                                     std::string(1, type),
                                     "' for object of type 'int'"));
  }
  uint64_t magnitude = value < 0 ? -static_cast<uint64_t>(value) : value;
  std::string digits;
  const char* alphabet =
      type == 'X' ? "0123456789ABCDEF" : "0123456789abcdef";
  do {
    digits.insert(digits.begin(), alphabet[magnitude % base]);
    magnitude /= base;
  } while (magnitude);
  digits = Group(digits, spec.grouping, base == 10 ? 3 : 4);
  std::string sign = SignOf(value < 0, spec);
  if (spec.alternate) sign += prefix;
  return Pad(sign, digits, spec, '>');
}

std::string Printf(const char* format, int precision, double value) {
  int size = snprintf(nullptr, 0, format, precision, value);
  std::string out(size + 1, '\0');
  snprintf(&out[0], out.size(), format, precision, value);
  out.resize(size);
  return out;
}

std::string FormatFloat(double value, const Spec& spec) {
  char type = spec.type;
  int precision = spec.precision;
  bool negative = std::signbit(value) && !std::isnan(value);
  double magnitude = std::fabs(value);
  std::string body;
  if (std::isnan(value) || std::isinf(value)) {
    body = std::isnan(value) ? "nan" : "inf";
    if (type == 'F' || type == 'E' || type == 'G') body = absl::AsciiStrToUpper(body);
    if (type == '%') body += "%";
    Spec padded = spec;
    padded.zero = false;
    return Pad(SignOf(negative, spec), body, padded, '>');
  }
  switch (type) {
    case 0:
      if (precision < 0) {
        body = FloatRepr(magnitude);
      } else {
        body = Printf("%.*g", precision == 0 ? 1 : precision, magnitude);
        if (body.find_first_of(".e") == std::string::npos) body += ".0";
      }
      break;
    case 'f':
    case 'F':
    case '%': {
      if (precision < 0) precision = 6;
      double shown = type == '%' ? magnitude * 100 : magnitude;
      body = Printf(spec.alternate ? "%#.*f" : "%.*f", precision, shown);
      if (type == '%') body += "%";
      break;
    }
    case 'e':
    case 'E':
      if (precision < 0) precision = 6;
      body = Printf(type == 'e' ? "%.*e" : "%.*E", precision, magnitude);
      break;
    case 'g':
    case 'G':
    case 'n':
      if (precision < 0) precision = 6;
      body = Printf(type == 'G' ? (spec.alternate ? "%#.*G" : "%.*G")
                                : (spec.alternate ? "%#.*g" : "%.*g"),
                    precision == 0 ? 1 : precision, magnitude);
      break;
    default:
      throw ScriptError("ValueError",
                        absl::StrCat("Unknown format code '",
                                     std::string(1, type),
                                     "' for object of type 'float'"));
  }
  if (spec.grouping) {
    size_t end = body.find_first_not_of("0123456789");
    if (end == std::string::npos) end = body.size();
    body = Group(body.substr(0, end), spec.grouping, 3) + body.substr(end);
  }
  return Pad(SignOf(negative, spec), body, spec, '>');
}

std::string ApplySpec(const Value& value, const Spec& spec,
                      const std::string& text) {
  switch (value.type()) {
    case Type::kBool:
      if (!spec.type) return Pad("", value.bool_value() ? "True" : "False", spec, '<');
      return FormatInt(value.int_value(), spec);
    case Type::kInt:
      if (spec.type && std::string("eEfFgG%").find(spec.type) != std::string::npos)
        return FormatFloat(static_cast<double>(value.int_value()), spec);
      if (spec.precision >= 0)
        throw ScriptError("ValueError",
                          "Precision not allowed in integer format specifier");
      return FormatInt(value.int_value(), spec);
    case Type::kFloat:
      return FormatFloat(value.float_value(), spec);
    case Type::kStr: {
      if (spec.type && spec.type != 's')
        throw ScriptError("ValueError",
                          absl::StrCat("Unknown format code '",
                                       std::string(1, spec.type),
                                       "' for object of type 'str'"));
      if (spec.align == '=')
        throw ScriptError("ValueError",
                          "'=' alignment not allowed in string format "
                          "specifier");
      std::string body = value.str();
      if (spec.precision >= 0 && Width(body) > spec.precision) {
        size_t pos = 0;
        for (int i = 0; i < spec.precision; i++) pos += CharLength(body, pos);
        body = body.substr(0, pos);
      }
      Spec padded = spec;
      padded.zero = false;
      if (spec.zero && !spec.align) {
        padded.fill = "0";
        padded.align = '<';
      }
      return Pad("", body, padded, '<');
    }
    default:
      throw ScriptError("TypeError", "unsupported format string passed to " +
                                         TypeName(value) + ".__format__: '" +
                                         text + "'");
  }
}

// Resolves "name[key][0]" against the call arguments.
Value LookupField(Interpreter* interpreter, const std::string& field,
                  const CallArgs& args, size_t* auto_index) {
  size_t bracket = field.find('[');
  std::string head = field.substr(0, bracket);
  Value value;
  if (head.empty()) {
    if (*auto_index >= args.args.size())
      throw ScriptError("IndexError",
                        "Replacement index " + absl::StrCat(*auto_index) +
                            " out of range for positional args tuple");
    value = args.args[(*auto_index)++];
  } else if (absl::ascii_isdigit(head[0])) {
    size_t index = 0;
    for (char c : head) {
      if (!absl::ascii_isdigit(c)) throw InvalidSpec();
      index = index * 10 + (c - '0');
    }
    if (index >= args.args.size())
      throw ScriptError("IndexError",
                        "Replacement index " + head +
                            " out of range for positional args tuple");
    value = args.args[index];
  } else {
    const Value* found = args.Get(SIZE_MAX, head.c_str());
    if (!found) throw ScriptError("KeyError", "'" + head + "'");
    value = *found;
  }
  while (bracket != std::string::npos) {
    size_t close = field.find(']', bracket);
    if (close == std::string::npos)
      throw ScriptError("ValueError", "Missing ']' in format string");
    std::string key = field.substr(bracket + 1, close - bracket - 1);
    bool numeric = !key.empty() && key.size() <= 18 &&
                   key.find_first_not_of("0123456789") == std::string::npos;
    value = interpreter->GetItem(
        value, numeric ? Value::Int(std::stoll(key)) : Value::Str(key));
    bracket = close + 1 < field.size() ? close + 1 : std::string::npos;
    if (bracket != std::string::npos && field[bracket] != '[')
      throw ScriptError("ValueError",
                        "Only '[' may follow ']' in format field specifier");
  }
  return value;
}

std::string FormatStringImpl(Interpreter* interpreter,
                             const std::string& format, const CallArgs& args,
                             size_t* auto_index, int depth) {
  if (depth > 2) throw ScriptError("ValueError", "Max string recursion exceeded");
  std::string out;
  size_t i = 0;
  while (i < format.size()) {
    char c = format[i];
    if (c == '}') {
      if (i + 1 < format.size() && format[i + 1] == '}') {
        out += '}';
        i += 2;
        continue;
      }
      throw ScriptError("ValueError",
                        "Single '}' encountered in format string");
    }
    if (c != '{') {
      out += c;
      i++;
      continue;
    }
    if (i + 1 < format.size() && format[i + 1] == '{') {
      out += '{';
      i += 2;
      continue;
    }
    // Find the matching close brace, allowing nested fields in the spec.
    size_t start = i + 1;
    int nesting = 1;
    size_t j = start;
    for (; j < format.size(); j++) {
      if (format[j] == '{') nesting++;
      if (format[j] == '}' && --nesting == 0) break;
    }
    if (j >= format.size())
      throw ScriptError("ValueError", "Single '{' encountered in format string");
    std::string field = format.substr(start, j - start);
    i = j + 1;
    std::string spec;
    char conversion = 0;
    size_t colon = field.find(':');
    if (colon != std::string::npos) {
      spec = FormatStringImpl(interpreter, field.substr(colon + 1), args,
                              auto_index, depth + 1);
      field = field.substr(0, colon);
    }
    size_t bang = field.find('!');
    if (bang != std::string::npos) {
      if (bang + 2 != field.size() ||
          (field[bang + 1] != 'r' && field[bang + 1] != 's' &&
           field[bang + 1] != 'a'))
        throw ScriptError("ValueError",
                          "Unknown conversion specifier " +
                              field.substr(bang + 1));
      conversion = field[bang + 1];
      field = field.substr(0, bang);
    }
    Value value = LookupField(interpreter, field, args, auto_index);
    if (conversion == 'r' || conversion == 'a') {
      value = Value::Str(Repr(value));
    } else if (conversion == 's') {
      value = Value::Str(Str(value));
    }
    out += FormatValue(value, spec);
  }
  return out;
}

}  // namespace

std::string FormatValue(const Value& value, const std::string& spec) {
  if (spec.empty()) return Str(value);
  return ApplySpec(value, ParseSpec(spec), spec);
}

std::string FormatString(Interpreter* interpreter, const std::string& format,
                         const CallArgs& args) {
  size_t auto_index = 0;
  return FormatStringImpl(interpreter, format, args, &auto_index, 0);
}

std::string PercentFormat(const std::string& format, const Value& args) {
  std::vector<Value> positional;
  const Value* mapping = nullptr;
  if (args.is_tuple()) {
    positional = args.items();
  } else {
    positional.push_back(args);
    if (args.is_dict()) mapping = &args;
  }
  size_t next = 0;
  bool used_mapping = false;
  auto take = [&positional, &next]() -> Value {
    if (next >= positional.size())
      throw ScriptError("TypeError", "not enough arguments for format string");
    return positional[next++];
  };
  std::string out;
  size_t i = 0;
  while (i < format.size()) {
    if (format[i] != '%') {
      out += format[i++];
      continue;
    }
    i++;
    if (i >= format.size()) throw ScriptError("ValueError", "incomplete format");
    if (format[i] == '%') {
      out += '%';
      i++;
      continue;
    }
    Value value;
    bool has_value = false;
    if (format[i] == '(') {
      size_t close = format.find(')', i);
      if (close == std::string::npos)
        throw ScriptError("ValueError", "incomplete format key");
      if (!mapping) throw ScriptError("TypeError", "format requires a mapping");
      Value key = Value::Str(format.substr(i + 1, close - i - 1));
      Value* found = mapping->dict().Find(key);
      if (!found) throw ScriptError("KeyError", Repr(key));
      value = *found;
      has_value = true;
      used_mapping = true;
      i = close + 1;
    }
    Spec spec;
    spec.align = '>';
    for (; i < format.size(); i++) {
      char flag = format[i];
      if (flag == '-') {
        spec.align = '<';
      } else if (flag == '+' || flag == ' ') {
        if (spec.sign != '+') spec.sign = flag;
      } else if (flag == '0') {
        spec.zero = true;
      } else if (flag == '#') {
        spec.alternate = true;
      } else {
        break;
      }
    }
    if (i < format.size() && format[i] == '*') {
      spec.width = ToIndex(take(), "* wants int");
      i++;
    } else {
      int64_t width = 0;
      bool has_width = false;
      while (i < format.size() && absl::ascii_isdigit(format[i])) {
        width = width * 10 + (format[i++] - '0');
        has_width = true;
      }
      if (has_width) spec.width = width;
    }
    if (i < format.size() && format[i] == '.') {
      i++;
      int precision = 0;
      while (i < format.size() && absl::ascii_isdigit(format[i]))
        precision = precision * 10 + (format[i++] - '0');
      spec.precision = precision;
    }
    if (i >= format.size()) throw ScriptError("ValueError", "incomplete format");
    char type = format[i++];
    if (!has_value) value = take();
    if (spec.zero && spec.align == '<') spec.zero = false;
    if (spec.zero) {
      spec.fill = "0";
      spec.align = '=';
      spec.zero = false;
    }
    switch (type) {
      case 's':
      case 'r':
      case 'a': {
        std::string text = type == 's' ? Str(value) : Repr(value);
        if (spec.align == '=') spec.align = '>';
        spec.fill = " ";
        out += ApplySpec(Value::Str(text), spec, "s");
        break;
      }
      case 'd':
      case 'i':
      case 'u': {
        int64_t n;
        if (value.is_float()) {
          if (!std::isfinite(value.float_value()))
            throw ScriptError("OverflowError",
                              "cannot convert float infinity to integer");
          n = static_cast<int64_t>(value.float_value());
        } else if (value.is_int() || value.is_bool()) {
          n = value.int_value();
        } else {
          throw ScriptError("TypeError", "%d format: a real number is required, not " +
                                             TypeName(value));
        }
        spec.type = 'd';
        spec.precision = -1;
        out += FormatInt(n, spec);
        break;
      }
      case 'x':
      case 'X':
      case 'o':
      case 'c': {
        if (type == 'c' && value.is_str()) {
          out += ApplySpec(value, spec, "c");
          break;
        }
        if (!value.is_int() && !value.is_bool())
          throw ScriptError("TypeError", std::string("%") + type +
                                             " format: an integer is required, "
                                             "not " + TypeName(value));
        spec.type = type;
        spec.precision = -1;
        out += FormatInt(value.int_value(), spec);
        break;
      }
      case 'f':
      case 'F':
      case 'e':
      case 'E':
      case 'g':
      case 'G': {
        if (!value.is_number())
          throw ScriptError("TypeError", std::string("must be real number, not ") +
                                             TypeName(value));
        spec.type = type;
        out += FormatFloat(value.AsDouble(), spec);
        break;
      }
      default:
        throw ScriptError("ValueError",
                          absl::StrCat("unsupported format character '",
                                       std::string(1, type), "'"));
    }
  }
  if (!used_mapping && next < positional.size() && !mapping)
    throw ScriptError("TypeError",
                      "not all arguments converted during string formatting");
  return out;
}

}  // namespace script
