/***
 * Name: pybox::rt formatting
 * Purpose: format() specs, str.format() and printf-style `%` formatting.
 * Theory of Operation:
 *   A spec is parsed into FormatSpec once ([[fill]align][sign][#][0][width]
 *   [,|_][.precision][type]) and applied to an int, float or string.
 *   Float conversions go through snprintf, whose %e/%f/%g rules match
 *   Python's for the same precision.
 */
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "runtime/Builtins.h"
#include "runtime/Heap.h"
#include "runtime/Interpreter.h"
#include "runtime/Native.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/Text.h"
#include "runtime/detail/ArgReader.h"

namespace pybox::rt {

namespace {

const BuiltinTypes& types() { return builtinTypes(); }

struct FormatSpec {
  std::string fill{" "};
  char align{'\0'};
  char sign{'-'};
  bool alternate{false};
  std::size_t width{0};
  char grouping{'\0'};
  int precision{-1};
  char type{'\0'};
};

FormatSpec parseSpec(const std::string& spec) {
  FormatSpec out;
  const std::u32string cps = text::decode(spec);
  std::size_t i = 0;
  auto isAlign = [](char32_t c) { return c == U'<' || c == U'>' || c == U'^' || c == U'='; };
  if (cps.size() >= 2 && isAlign(cps[1])) {
    out.fill = text::encode(cps[0]);
    out.align = static_cast<char>(cps[1]);
    i = 2;
  } else if (!cps.empty() && isAlign(cps[0])) {
    out.align = static_cast<char>(cps[0]);
    i = 1;
  }
  if (i < cps.size() && (cps[i] == U'+' || cps[i] == U'-' || cps[i] == U' ')) { out.sign = static_cast<char>(cps[i++]); }
  if (i < cps.size() && cps[i] == U'#') {
    out.alternate = true;
    ++i;
  }
  if (i < cps.size() && cps[i] == U'0') {
    if (out.align == '\0') {
      out.fill = "0";
      out.align = '=';
    }
    ++i;
  }
  while (i < cps.size() && cps[i] >= U'0' && cps[i] <= U'9') {
    out.width = out.width * 10 + static_cast<std::size_t>(cps[i++] - U'0');
    if (out.width > 100000) { raise(types().valueError, "Too many decimal digits in format string"); }
  }
  if (i < cps.size() && (cps[i] == U',' || cps[i] == U'_')) { out.grouping = static_cast<char>(cps[i++]); }
  if (i < cps.size() && cps[i] == U'.') {
    ++i;
    if (i >= cps.size() || cps[i] < U'0' || cps[i] > U'9') { raise(types().valueError, "Format specifier missing precision"); }
    out.precision = 0;
    while (i < cps.size() && cps[i] >= U'0' && cps[i] <= U'9') {
      out.precision = out.precision * 10 + static_cast<int>(cps[i++] - U'0');
      if (out.precision > 1000) { raise(types().valueError, "precision too big"); }
    }
  }
  if (i < cps.size()) { out.type = static_cast<char>(cps[i++]); }
  if (i != cps.size()) { raise(types().valueError, "Invalid format specifier '" + spec + "'"); }
  return out;
}

std::string group(const std::string& digits, char sep, std::size_t every) {
  std::string out;
  const std::size_t n = digits.size();
  for (std::size_t i = 0; i < n; ++i) {
    if (i != 0 && (n - i) % every == 0) { out += sep; }
    out += digits[i];
  }
  return out;
}

// Pads `body` (already signed) to the spec width.
std::string pad(const FormatSpec& spec, const std::string& sign, const std::string& body, char defaultAlign) {
  const std::size_t len = text::length(sign) + text::length(body);
  if (len >= spec.width) { return sign + body; }
  const std::size_t missing = spec.width - len;
  auto fill = [&](std::size_t n) {
    std::string s;
    for (std::size_t k = 0; k < n; ++k) { s += spec.fill; }
    return s;
  };
  switch (spec.align != '\0' ? spec.align : defaultAlign) {
    case '<': return sign + body + fill(missing);
    case '^': return fill(missing / 2) + sign + body + fill(missing - missing / 2);
    case '=': return sign + fill(missing) + body;
    default: return fill(missing) + sign + body;
  }
}

std::string signOf(bool negative, char sign) {
  if (negative) { return "-"; }
  if (sign == '+') { return "+"; }
  if (sign == ' ') { return " "; }
  return "";
}

std::string printfFloat(double d, int precision, char conv, bool alternate) {
  char fmt[16];
  std::snprintf(fmt, sizeof fmt, "%%%s.%d%c", alternate ? "#" : "", precision, conv);
  std::vector<char> buf(static_cast<std::size_t>(precision) + 400);
  std::snprintf(buf.data(), buf.size(), fmt, d);
  return buf.data();
}

std::string formatFloatSpec(double d, const FormatSpec& spec) {
  const bool negative = std::signbit(d) && !std::isnan(d);
  const double mag = std::fabs(d);
  std::string body;
  char type = spec.type;
  int precision = spec.precision;
  if (type == '\0' && precision < 0) {
    body = formatFloat(mag);
  } else if (type == '\0') {
    body = printfFloat(mag, precision == 0 ? 1 : precision, 'g', spec.alternate);
    if (std::isfinite(mag) && body.find_first_of(".e") == std::string::npos) { body += ".0"; }
  } else {
    if (precision < 0) { precision = 6; }
    switch (type) {
      case 'e':
      case 'E':
      case 'f':
      case 'F': body = printfFloat(mag, precision, type, spec.alternate); break;
      case 'g':
      case 'G':
      case 'n': body = printfFloat(mag, precision == 0 ? 1 : precision, type == 'n' ? 'g' : type, spec.alternate); break;
      case '%': body = printfFloat(mag * 100.0, precision, 'f', spec.alternate) + "%"; break;
      default:
        raise(types().valueError, std::string("Unknown format code '") + type + "' for object of type 'float'");
    }
  }
  if (spec.grouping != '\0' && std::isfinite(mag)) {
    const std::size_t end = body.find_first_not_of("0123456789");
    const std::string intPart = body.substr(0, end);
    body = group(intPart, spec.grouping, 3) + (end == std::string::npos ? "" : body.substr(end));
  }
  return pad(spec, signOf(negative, spec.sign), body, '>');
}

std::string formatIntSpec(long long v, const FormatSpec& spec) {
  switch (spec.type) {
    case 'e':
    case 'E':
    case 'f':
    case 'F':
    case 'g':
    case 'G':
    case '%': return formatFloatSpec(static_cast<double>(v), spec);
    default: break;
  }
  if (spec.precision >= 0) { raise(types().valueError, "Precision not allowed in integer format specifier"); }
  const bool negative = v < 0;
  unsigned long long mag = negative ? 0ULL - static_cast<unsigned long long>(v) : static_cast<unsigned long long>(v);
  unsigned base = 10;
  std::string prefix;
  const char* digits = "0123456789abcdef";
  switch (spec.type) {
    case '\0':
    case 'd':
    case 'n': break;
    case 'b': base = 2; prefix = "0b"; break;
    case 'o': base = 8; prefix = "0o"; break;
    case 'x': base = 16; prefix = "0x"; break;
    case 'X':
      base = 16;
      prefix = "0X";
      digits = "0123456789ABCDEF";
      break;
    case 'c': {
      if (v < 0 || v > 0x10FFFF) { raise(types().overflowError, "%c arg not in range(0x110000)"); }
      return pad(spec, "", text::encode(static_cast<char32_t>(v)), '<');
    }
    default:
      raise(types().valueError, std::string("Unknown format code '") + spec.type + "' for object of type 'int'");
  }
  std::string body;
  do {
    body += digits[mag % base];
    mag /= base;
  } while (mag != 0);
  std::reverse(body.begin(), body.end());
  if (spec.grouping != '\0') { body = group(body, spec.grouping, base == 10 ? 3 : 4); }
  std::string sign = signOf(negative, spec.sign);
  if (spec.alternate) { sign += prefix; }
  return pad(spec, sign, body, '>');
}

std::string formatStrSpec(const std::string& s, const FormatSpec& spec) {
  if (spec.type != '\0' && spec.type != 's') {
    raise(types().valueError, std::string("Unknown format code '") + spec.type + "' for object of type 'str'");
  }
  if (spec.sign != '-') { raise(types().valueError, "Sign not allowed in string format specifier"); }
  if (spec.align == '=') { raise(types().valueError, "'=' alignment not allowed in string format specifier"); }
  std::string body = s;
  if (spec.precision >= 0) {
    const std::u32string cps = text::decode(s);
    if (cps.size() > static_cast<std::size_t>(spec.precision)) {
      body = text::encode(cps.substr(0, static_cast<std::size_t>(spec.precision)));
    }
  }
  return pad(spec, "", body, '<');
}

// %-format helpers
std::string percentNumber(const Value& v, char conv, const FormatSpec& spec) {
  if (!v.isNumber()) {
    raise(types().typeError, std::string("%") + conv + " format: a real number is required, not " + typeName(v));
  }
  FormatSpec s = spec;
  switch (conv) {
    case 'd':
    case 'i':
    case 'u': {
      s.type = 'd';
      const long long i = v.isFloat() ? static_cast<long long>(std::trunc(v.asFloat())) : v.asInt();
      s.precision = -1;
      return formatIntSpec(i, s);
    }
    case 'x':
    case 'X':
    case 'o': {
      if (!v.isIntegral()) {
        raise(types().typeError, std::string("%") + conv + " format: an integer is required, not " + typeName(v));
      }
      s.type = conv;
      s.precision = -1;
      return formatIntSpec(v.asInt(), s);
    }
    default:
      s.type = conv;
      if (s.precision < 0) { s.precision = 6; }
      return formatFloatSpec(v.asFloat(), s);
  }
}

} // namespace

std::string formatWithSpec(Interpreter& interp, const Value& v, const std::string& spec) {
  (void)interp;
  if (spec.empty()) { return str(v); }
  const FormatSpec parsed = parseSpec(spec);
  if (v.isIntegral()) { return formatIntSpec(v.asInt(), parsed); }
  if (v.isFloat()) { return formatFloatSpec(v.asFloat(), parsed); }
  if (const auto* s = v.as<StrObj>()) { return formatStrSpec(s->value, parsed); }
  if (v.as<EnumMember>() != nullptr) { return formatStrSpec(str(v), parsed); }
  raise(types().typeError, "unsupported format string passed to " + typeName(v) + ".__format__");
}

std::string percentFormat(const std::string& fmt, const Value& args) {
  ValueList items;
  const DictObj* mapping = args.as<DictObj>();
  if (const auto* tuple = args.as<TupleObj>()) {
    items = tuple->items;
  } else if (mapping == nullptr) {
    items.push_back(args);
  }
  std::size_t next = 0;
  auto take = [&]() -> Value {
    if (next >= items.size()) { raise(types().typeError, "not enough arguments for format string"); }
    return items[next++];
  };
  std::string out;
  for (std::size_t i = 0; i < fmt.size(); ++i) {
    if (fmt[i] != '%') {
      out += fmt[i];
      continue;
    }
    if (++i >= fmt.size()) { raise(types().valueError, "incomplete format"); }
    Value keyed;
    bool haveKeyed = false;
    if (fmt[i] == '(') {
      const std::size_t close = fmt.find(')', i);
      if (close == std::string::npos) { raise(types().valueError, "incomplete format key"); }
      if (mapping == nullptr) { raise(types().typeError, "format requires a mapping"); }
      const Value key = newStr(fmt.substr(i + 1, close - i - 1));
      const Value* found = mapping->table.find(key);
      if (found == nullptr) { throw ScriptError(make<ExceptionObj>(types().keyError, ValueList{key})); }
      keyed = *found;
      haveKeyed = true;
      i = close + 1;
    }
    FormatSpec spec;
    spec.align = '>';
    for (; i < fmt.size(); ++i) {
      const char c = fmt[i];
      if (c == '-') {
        spec.align = '<';
      } else if (c == '+') {
        spec.sign = '+';
      } else if (c == ' ') {
        if (spec.sign != '+') { spec.sign = ' '; }
      } else if (c == '#') {
        spec.alternate = true;
      } else if (c == '0') {
        if (spec.align != '<') {
          spec.fill = "0";
          spec.align = '=';
        }
      } else {
        break;
      }
    }
    while (i < fmt.size() && fmt[i] >= '0' && fmt[i] <= '9') { spec.width = spec.width * 10 + static_cast<std::size_t>(fmt[i++] - '0'); }
    if (i < fmt.size() && fmt[i] == '.') {
      spec.precision = 0;
      ++i;
      while (i < fmt.size() && fmt[i] >= '0' && fmt[i] <= '9') { spec.precision = spec.precision * 10 + (fmt[i++] - '0'); }
    }
    if (i >= fmt.size()) { raise(types().valueError, "incomplete format"); }
    const char conv = fmt[i];
    if (conv == '%') {
      out += '%';
      continue;
    }
    const Value v = haveKeyed ? keyed : take();
    switch (conv) {
      case 's':
      case 'r':
      case 'a': {
        std::string s = conv == 's' ? str(v) : repr(v);
        if (spec.precision >= 0) {
          const std::u32string cps = text::decode(s);
          if (cps.size() > static_cast<std::size_t>(spec.precision)) {
            s = text::encode(cps.substr(0, static_cast<std::size_t>(spec.precision)));
          }
        }
        spec.fill = " ";
        out += pad(spec, "", s, '>');
        break;
      }
      case 'c': {
        if (const auto* s = v.as<StrObj>()) {
          if (text::length(s->value) != 1) { raise(types().typeError, "%c requires int or char"); }
          out += pad(spec, "", s->value, '>');
        } else {
          const long long cp = detail::toInteger(v);
          if (cp < 0 || cp > 0x10FFFF) { raise(types().overflowError, "%c arg not in range(0x110000)"); }
          out += pad(spec, "", text::encode(static_cast<char32_t>(cp)), '>');
        }
        break;
      }
      case 'd':
      case 'i':
      case 'u':
      case 'x':
      case 'X':
      case 'o':
      case 'e':
      case 'E':
      case 'f':
      case 'F':
      case 'g':
      case 'G': out += percentNumber(v, conv, spec); break;
      default:
        raise(types().valueError, std::string("unsupported format character '") + conv + "'");
    }
  }
  if (mapping == nullptr && next < items.size()) {
    raise(types().typeError, "not all arguments converted during string formatting");
  }
  return out;
}

namespace detail {

std::string formatString(Interpreter& interp, const std::string& fmt, CallArgs& args) {
  std::string out;
  std::size_t autoIndex = 0;
  bool usedAuto = false;
  bool usedManual = false;
  for (std::size_t i = 0; i < fmt.size(); ++i) {
    const char c = fmt[i];
    if (c == '}') {
      if (i + 1 < fmt.size() && fmt[i + 1] == '}') {
        out += '}';
        ++i;
        continue;
      }
      raise(types().valueError, "Single '}' encountered in format string");
    }
    if (c != '{') {
      out += c;
      continue;
    }
    if (i + 1 < fmt.size() && fmt[i + 1] == '{') {
      out += '{';
      ++i;
      continue;
    }
    // Find the matching close brace, allowing one level of nesting in the spec.
    std::size_t depth = 1;
    std::size_t j = i + 1;
    for (; j < fmt.size() && depth > 0; ++j) {
      if (fmt[j] == '{') { ++depth; }
      if (fmt[j] == '}') { --depth; }
    }
    if (depth != 0) { raise(types().valueError, "expected '}' before end of string"); }
    const std::string field = fmt.substr(i + 1, j - i - 2);
    i = j - 1;

    std::string ref = field;
    std::string spec;
    char conversion = '\0';
    const std::size_t colon = field.find(':');
    const std::size_t bang = field.find('!');
    if (colon != std::string::npos) {
      spec = field.substr(colon + 1);
      ref = field.substr(0, colon);
    }
    if (bang != std::string::npos && bang < ref.size()) {
      if (bang + 2 != ref.size()) { raise(types().valueError, "expected ':' after conversion specifier"); }
      conversion = ref[bang + 1];
      ref = ref.substr(0, bang);
    }

    const std::size_t split = ref.find_first_of(".[");
    const std::string head = ref.substr(0, split);
    Value value;
    if (head.empty()) {
      if (usedManual) { raise(types().valueError, "cannot switch from manual field specification to automatic field numbering"); }
      usedAuto = true;
      if (autoIndex >= args.positional.size()) {
        raise(types().indexError, "Replacement index " + std::to_string(autoIndex) + " out of range for positional args tuple");
      }
      value = args.positional[autoIndex++];
    } else if (head.find_first_not_of("0123456789") == std::string::npos) {
      if (usedAuto) { raise(types().valueError, "cannot switch from automatic field numbering to manual field specification"); }
      usedManual = true;
      const std::size_t index = std::stoul(head);
      if (index >= args.positional.size()) {
        raise(types().indexError, "Replacement index " + std::to_string(index) + " out of range for positional args tuple");
      }
      value = args.positional[index];
    } else {
      bool found = false;
      for (const auto& [name, v] : args.keywords) {
        if (name == head) {
          value = v;
          found = true;
        }
      }
      if (!found) { throw ScriptError(make<ExceptionObj>(types().keyError, ValueList{newStr(head)})); }
    }
    std::size_t pos = split == std::string::npos ? ref.size() : split;
    while (pos < ref.size()) {
      if (ref[pos] == '.') {
        const std::size_t end = ref.find_first_of(".[", pos + 1);
        value = interp.getAttr(value, ref.substr(pos + 1, end == std::string::npos ? std::string::npos : end - pos - 1));
        pos = end == std::string::npos ? ref.size() : end;
      } else {
        const std::size_t end = ref.find(']', pos);
        if (end == std::string::npos) { raise(types().valueError, "Missing ']' in format string"); }
        const std::string key = ref.substr(pos + 1, end - pos - 1);
        const bool numeric = !key.empty() && key.find_first_not_of("0123456789") == std::string::npos;
        value = getItem(value, numeric ? Value::integer(std::stoll(key)) : newStr(key));
        pos = end + 1;
      }
    }
    if (conversion == 'r' || conversion == 'a') {
      value = newStr(repr(value));
    } else if (conversion == 's') {
      value = newStr(str(value));
    } else if (conversion != '\0') {
      raise(types().valueError, std::string("Unknown conversion specifier ") + conversion);
    }
    if (spec.find('{') != std::string::npos) {
      CallArgs nested = args;
      spec = formatString(interp, spec, nested);
    }
    out += formatWithSpec(interp, value, spec);
  }
  return out;
}

} // namespace detail

} // namespace pybox::rt
