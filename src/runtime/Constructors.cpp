/***
 * Name: pybox::rt built-in type constructors
 * Purpose: Calling bool, int, float, str, list, tuple, dict, set, range and type.
 * Theory of Operation:
 *   Text to number conversion accepts what Python's int() and float() accept:
 *   surrounding whitespace, a sign, `_` between digits, base prefixes for
 *   base 0 or a matching base, and inf/nan spellings for float.
 */
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>

#include "runtime/Builtins.h"
#include "runtime/Interpreter.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/Text.h"
#include "runtime/detail/ArgReader.h"

namespace pybox::rt::detail {

namespace {

const BuiltinTypes& types() { return builtinTypes(); }

std::string trimmed(const std::string& text) {
  std::size_t b = 0;
  std::size_t e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b])) != 0) { ++b; }
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1])) != 0) { --e; }
  return text.substr(b, e - b);
}

std::string lowered(std::string s) {
  for (auto& c : s) { c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
  return s;
}

int digitValue(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  if (c >= 'a' && c <= 'z') { return c - 'a' + 10; }
  if (c >= 'A' && c <= 'Z') { return c - 'A' + 10; }
  return 99;
}

ValueList pairOf(Interpreter& interp, const Value& item, std::size_t index) {
  ValueList kv = interp.materialize(item);
  if (kv.size() != 2) {
    raise(types().valueError, "dictionary update sequence element #" + std::to_string(index) + " has length " +
                                  std::to_string(kv.size()) + "; 2 is required");
  }
  return kv;
}

} // namespace

std::optional<long long> parseIntText(const std::string& raw, int base) {
  const std::string text = trimmed(raw);
  std::size_t i = 0;
  bool negative = false;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    negative = text[i] == '-';
    ++i;
  }
  auto prefixed = [&](char lower) {
    return i + 1 < text.size() && text[i] == '0' && std::tolower(static_cast<unsigned char>(text[i + 1])) == lower;
  };
  if (base == 0) {
    if (prefixed('x')) {
      base = 16;
      i += 2;
    } else if (prefixed('o')) {
      base = 8;
      i += 2;
    } else if (prefixed('b')) {
      base = 2;
      i += 2;
    } else {
      base = 10;
      // Base 0 rejects leading zeros on a non-zero decimal.
      std::size_t j = i;
      while (j < text.size() && (text[j] == '0' || text[j] == '_')) { ++j; }
      if (j > i && j < text.size()) { return std::nullopt; }
    }
    if (base != 10 && i < text.size() && text[i] == '_') { ++i; }
  } else if ((base == 16 && prefixed('x')) || (base == 8 && prefixed('o')) || (base == 2 && prefixed('b'))) {
    i += 2;
    if (i < text.size() && text[i] == '_') { ++i; }
  }
  if (i >= text.size()) { return std::nullopt; }
  unsigned long long magnitude = 0;
  const unsigned long long limit = negative ? 9223372036854775808ULL : 9223372036854775807ULL;
  bool lastUnderscore = true;
  for (; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '_') {
      if (lastUnderscore) { return std::nullopt; }
      lastUnderscore = true;
      continue;
    }
    const int d = digitValue(c);
    if (d >= base) { return std::nullopt; }
    lastUnderscore = false;
    if (magnitude > (limit - static_cast<unsigned long long>(d)) / static_cast<unsigned long long>(base)) {
      raise(types().overflowError, "int too large to convert");
    }
    magnitude = magnitude * static_cast<unsigned long long>(base) + static_cast<unsigned long long>(d);
  }
  if (lastUnderscore) { return std::nullopt; }
  if (negative) { return magnitude == 9223372036854775808ULL ? std::numeric_limits<long long>::min()
                                                              : -static_cast<long long>(magnitude); }
  return static_cast<long long>(magnitude);
}

std::optional<double> parseFloatText(const std::string& raw) {
  std::string text = trimmed(raw);
  std::string body = text;
  double sign = 1.0;
  if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
    sign = body[0] == '-' ? -1.0 : 1.0;
    body.erase(0, 1);
  }
  const std::string lower = lowered(body);
  if (lower == "inf" || lower == "infinity") { return sign * std::numeric_limits<double>::infinity(); }
  if (lower == "nan") { return std::numeric_limits<double>::quiet_NaN(); }
  std::string digits;
  char prev = '\0';
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    if (c == '_') {
      const bool between = std::isdigit(static_cast<unsigned char>(prev)) != 0 && i + 1 < body.size() &&
                           std::isdigit(static_cast<unsigned char>(body[i + 1])) != 0;
      if (!between) { return std::nullopt; }
      prev = c;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) == 0 && c != '.' && c != 'e' && c != 'E' && c != '+' &&
        c != '-') {
      return std::nullopt;
    }
    digits += c;
    prev = c;
  }
  if (digits.empty() || digits == "." || digits[0] == '+' || digits[0] == '-') { return std::nullopt; }
  double value = 0.0;
  const auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (res.ptr != digits.data() + digits.size()) { return std::nullopt; }
  if (res.ec == std::errc::result_out_of_range) {
    value = std::strtod(digits.c_str(), nullptr);
  } else if (res.ec != std::errc()) {
    return std::nullopt;
  }
  return sign * value;
}

Value constructObject(Interpreter&, CallArgs&) {
  raise(types().typeError, "cannot create 'object' instances");
}

Value constructBool(Interpreter&, CallArgs& args) {
  ArgReader r("bool", args);
  r.noKeywords();
  r.expect(0, 1);
  return Value::boolean(r.count() == 1 && truthy(r.at(0)));
}

Value constructInt(Interpreter&, CallArgs& args) {
  ArgReader r("int", args);
  auto x = r.argument(0, "x");
  auto baseArg = r.argument(1, "base");
  r.finish();
  if (!x) {
    if (baseArg) { raise(types().typeError, "int() missing string argument"); }
    return Value::integer(0);
  }
  if (baseArg) {
    const auto* s = x->as<StrObj>();
    if (s == nullptr) { raise(types().typeError, "int() can't convert non-string with explicit base"); }
    const long long base = toInteger(*baseArg);
    if (base != 0 && (base < 2 || base > 36)) { raise(types().valueError, "int() base must be >= 2 and <= 36, or 0"); }
    if (auto v = parseIntText(s->value, static_cast<int>(base))) { return Value::integer(*v); }
    raise(types().valueError,
          "invalid literal for int() with base " + std::to_string(base) + ": " + reprString(s->value));
  }
  if (x->isIntegral()) { return Value::integer(x->asInt()); }
  if (x->isFloat()) {
    const double d = std::trunc(x->asFloat());
    if (std::isnan(d)) { raise(types().valueError, "cannot convert float NaN to integer"); }
    if (std::isinf(d)) { raise(types().overflowError, "cannot convert float infinity to integer"); }
    if (d >= 9223372036854775808.0 || d < -9223372036854775808.0) {
      raise(types().overflowError, "int too large to convert");
    }
    return Value::integer(static_cast<long long>(d));
  }
  if (const auto* s = x->as<StrObj>()) {
    if (auto v = parseIntText(s->value, 10)) { return Value::integer(*v); }
    raise(types().valueError, "invalid literal for int() with base 10: " + reprString(s->value));
  }
  raise(types().typeError,
        "int() argument must be a string, a bytes-like object or a real number, not '" + typeName(*x) + "'");
}

Value constructFloat(Interpreter&, CallArgs& args) {
  ArgReader r("float", args);
  r.noKeywords();
  r.expect(0, 1);
  if (r.count() == 0) { return Value::real(0.0); }
  const Value& x = r.at(0);
  if (x.isNumber()) { return Value::real(x.asFloat()); }
  if (const auto* s = x.as<StrObj>()) {
    if (auto v = parseFloatText(s->value)) { return Value::real(*v); }
    raise(types().valueError, "could not convert string to float: " + reprString(s->value));
  }
  raise(types().typeError, "float() argument must be a string or a real number, not '" + typeName(x) + "'");
}

Value constructStr(Interpreter&, CallArgs& args) {
  ArgReader r("str", args);
  auto object = r.argument(0, "object");
  auto encoding = r.argument(1, "encoding");
  auto errors = r.argument(2, "errors");
  r.finish();
  if (!object) { return newStr(""); }
  if (encoding || errors) {
    const auto* b = object->as<BytesObj>();
    if (b == nullptr) { raise(types().typeError, "decoding to str: need a bytes-like object, " + typeName(*object) + " found"); }
    if (!text::isValidUtf8(b->value)) {
      const std::string mode = errors ? toString(*errors, "str") : std::string("strict");
      if (mode == "strict") { raise(types().valueError, "'utf-8' codec can't decode bytes"); }
      return newStr(text::encode(text::decode(b->value)));
    }
    return newStr(b->value);
  }
  return newStr(str(*object));
}

Value constructList(Interpreter& interp, CallArgs& args) {
  ArgReader r("list", args);
  r.noKeywords();
  r.expect(0, 1);
  if (r.count() == 0) { return newList(); }
  return newList(interp.materialize(r.at(0)));
}

Value constructTuple(Interpreter& interp, CallArgs& args) {
  ArgReader r("tuple", args);
  r.noKeywords();
  r.expect(0, 1);
  if (r.count() == 0) { return newTuple(); }
  if (r.at(0).as<TupleObj>() != nullptr) { return r.at(0); }
  return newTuple(interp.materialize(r.at(0)));
}

Value constructDict(Interpreter& interp, CallArgs& args) {
  ArgReader r("dict", args);
  r.expect(0, 1);
  Value dict = newDict();
  auto& table = dict.as<DictObj>()->table;
  if (r.count() == 1) {
    if (const auto* source = r.at(0).as<DictObj>()) {
      for (const auto& e : source->table.entries()) { table.insert(e.key, e.value); }
    } else {
      std::size_t index = 0;
      interp.iterate(r.at(0), [&](const Value& item) {
        ValueList kv = pairOf(interp, item, index++);
        table.insert(kv[0], kv[1]);
        return true;
      });
    }
  }
  for (auto& [name, value] : args.keywords) { table.insert(newStr(name), value); }
  return dict;
}

Value constructSet(Interpreter& interp, CallArgs& args) {
  ArgReader r("set", args);
  r.noKeywords();
  r.expect(0, 1);
  Value set = newSet();
  if (r.count() == 1) {
    auto& table = set.as<SetObj>()->table;
    interp.iterate(r.at(0), [&](const Value& item) {
      Heap::checkLength(table.size() + 1);
      table.insert(item, Value());
      return true;
    });
  }
  return set;
}

Value constructRange(Interpreter&, CallArgs& args) {
  ArgReader r("range", args);
  r.noKeywords();
  r.expect(1, 3);
  long long start = 0;
  long long stop = 0;
  long long step = 1;
  if (r.count() == 1) {
    stop = r.integer(0);
  } else {
    start = r.integer(0);
    stop = r.integer(1);
    if (r.count() == 3) { step = r.integer(2); }
  }
  if (step == 0) { raise(types().valueError, "range() arg 3 must not be zero"); }
  return make<RangeObj>(start, stop, step);
}

Value constructType(Interpreter&, CallArgs& args) {
  ArgReader r("type", args);
  r.noKeywords();
  if (r.count() != 1) { raise(types().typeError, "type() takes 1 argument"); }
  return Value(typeOf(r.at(0)));
}

} // namespace pybox::rt::detail
