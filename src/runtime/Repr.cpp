/***
 * Name: pybox::rt::repr / str
 * Purpose: Python-compatible text renderings of values.
 * Theory of Operation:
 *   Floats use the shortest round-trip digits (std::to_chars) laid out the
 *   way Python's repr does: positional between 1e-4 and 1e16, scientific
 *   otherwise. Containers that reach themselves render as [...] / {...}.
 */
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

#include "runtime/Callable.h"
#include "runtime/Native.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/Text.h"
#include "runtime/detail/NestingGuard.h"

namespace pybox::rt {

namespace {

class ReprStack {
 public:
  explicit ReprStack(const Object* obj) {
    auto& s = stack();
    active_ = std::find(s.begin(), s.end(), obj) != s.end();
    if (!active_) { s.push_back(obj); }
  }
  ~ReprStack() {
    if (!active_) { stack().pop_back(); }
  }
  ReprStack(const ReprStack&) = delete;
  ReprStack& operator=(const ReprStack&) = delete;
  // True when obj is already being rendered further up.
  bool recursive() const { return active_; }

 private:
  static std::vector<const Object*>& stack() {
    thread_local std::vector<const Object*> s;
    return s;
  }
  bool active_{false};
};

void appendHex(std::string& out, const char* prefix, unsigned long value, int width) {
  char buf[16];
  std::snprintf(buf, sizeof buf, "%0*lx", width, value);
  out += prefix;
  out += buf;
}

std::string joinItems(const ValueList& items) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i != 0) { out += ", "; }
    out += repr(items[i]);
  }
  return out;
}

std::string reprBytes(const std::string& b) {
  const bool useDouble = b.find('\'') != std::string::npos && b.find('"') == std::string::npos;
  const char quote = useDouble ? '"' : '\'';
  std::string out = "b";
  out += quote;
  for (unsigned char c : b) {
    if (c == '\\' || c == static_cast<unsigned char>(quote)) {
      out += '\\';
      out += static_cast<char>(c);
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else if (c < 0x20 || c >= 0x7f) {
      appendHex(out, "\\x", c, 2);
    } else {
      out += static_cast<char>(c);
    }
  }
  out += quote;
  return out;
}

} // namespace

std::string formatFloat(double d) {
  if (std::isnan(d)) { return "nan"; }
  if (std::isinf(d)) { return d > 0 ? "inf" : "-inf"; }
  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof buf, d, std::chars_format::scientific);
  std::string sci(buf, res.ptr);
  std::string sign;
  if (!sci.empty() && sci[0] == '-') {
    sign = "-";
    sci.erase(0, 1);
  }
  const auto epos = sci.find('e');
  const int exp = std::stoi(sci.substr(epos + 1));
  std::string digits;
  for (char c : sci.substr(0, epos)) {
    if (c != '.') { digits += c; }
  }
  while (digits.size() > 1 && digits.back() == '0') { digits.pop_back(); }

  if (exp < -4 || exp >= 16) {
    std::string out = sign + digits.substr(0, 1);
    if (digits.size() > 1) { out += "." + digits.substr(1); }
    char ebuf[8];
    std::snprintf(ebuf, sizeof ebuf, "e%c%02d", exp < 0 ? '-' : '+', std::abs(exp));
    return out + ebuf;
  }
  if (exp < 0) { return sign + "0." + std::string(static_cast<std::size_t>(-exp - 1), '0') + digits; }
  const auto intLen = static_cast<std::size_t>(exp) + 1;
  if (digits.size() <= intLen) { return sign + digits + std::string(intLen - digits.size(), '0') + ".0"; }
  return sign + digits.substr(0, intLen) + "." + digits.substr(intLen);
}

std::string reprString(const std::string& s) {
  const bool useDouble = s.find('\'') != std::string::npos && s.find('"') == std::string::npos;
  const char32_t quote = useDouble ? U'"' : U'\'';
  std::string out;
  out += static_cast<char>(quote);
  for (char32_t c : text::decode(s)) {
    if (c == U'\\' || c == quote) {
      out += '\\';
      out += static_cast<char>(c);
    } else if (c == U'\n') {
      out += "\\n";
    } else if (c == U'\r') {
      out += "\\r";
    } else if (c == U'\t') {
      out += "\\t";
    } else if (c < 0x20 || c == 0x7f) {
      appendHex(out, "\\x", c, 2);
    } else if (c < 0x7f || text::isPrintable(c)) {
      out += text::encode(c);
    } else if (c <= 0xff) {
      appendHex(out, "\\x", c, 2);
    } else if (c <= 0xffff) {
      appendHex(out, "\\u", c, 4);
    } else {
      appendHex(out, "\\U", c, 8);
    }
  }
  out += static_cast<char>(quote);
  return out;
}

std::string repr(const Value& v) {
  if (v.isNone()) { return "None"; }
  if (v.isBool()) { return v.asBool() ? "True" : "False"; }
  if (v.isInt()) { return std::to_string(v.asInt()); }
  if (v.isFloat()) { return formatFloat(v.asFloat()); }
  const Object* obj = v.object().get();
  detail::NestingGuard depth("repr");
  switch (obj->kind) {
    case ObjKind::Str: return reprString(static_cast<const StrObj*>(obj)->value);
    case ObjKind::Bytes: return reprBytes(static_cast<const BytesObj*>(obj)->value);
    case ObjKind::List: {
      ReprStack guard(obj);
      if (guard.recursive()) { return "[...]"; }
      return "[" + joinItems(static_cast<const ListObj*>(obj)->items) + "]";
    }
    case ObjKind::Tuple: {
      const ValueList& items = static_cast<const TupleObj*>(obj)->items;
      if (items.size() == 1) { return "(" + repr(items[0]) + ",)"; }
      return "(" + joinItems(items) + ")";
    }
    case ObjKind::Dict: {
      ReprStack guard(obj);
      if (guard.recursive()) { return "{...}"; }
      std::string out = "{";
      bool first = true;
      for (const auto& e : static_cast<const DictObj*>(obj)->table.entries()) {
        if (!first) { out += ", "; }
        first = false;
        out += repr(e.key) + ": " + repr(e.value);
      }
      return out + "}";
    }
    case ObjKind::Set: {
      const ValueList keys = static_cast<const SetObj*>(obj)->table.keys();
      if (keys.empty()) { return "set()"; }
      return "{" + joinItems(keys) + "}";
    }
    case ObjKind::Range: {
      const auto* r = static_cast<const RangeObj*>(obj);
      std::string out = "range(" + std::to_string(r->start) + ", " + std::to_string(r->stop);
      if (r->step != 1) { out += ", " + std::to_string(r->step); }
      return out + ")";
    }
    case ObjKind::Slice: {
      const auto* s = static_cast<const SliceObj*>(obj);
      return "slice(" + repr(s->lower) + ", " + repr(s->upper) + ", " + repr(s->step) + ")";
    }
    case ObjKind::Iterator: return "<" + static_cast<const IteratorObj*>(obj)->typeName + " object>";
    case ObjKind::Function: return "<function " + static_cast<const FunctionObj*>(obj)->name + ">";
    case ObjKind::Builtin: {
      const auto* b = static_cast<const BuiltinFunction*>(obj);
      if (b->self.isNone()) { return "<built-in function " + b->name + ">"; }
      return "<built-in method " + b->name + " of " + typeName(b->self) + " object>";
    }
    case ObjKind::Coroutine: {
      const auto* c = static_cast<const CoroutineObj*>(obj);
      return "<coroutine object " + (c->fn ? c->fn->name : std::string("?")) + ">";
    }
    case ObjKind::Type: return "<class '" + static_cast<const TypeObject*>(obj)->name + "'>";
    case ObjKind::Exception: {
      const auto* e = static_cast<const ExceptionObj*>(obj);
      return e->type->name + "(" + joinItems(e->args) + ")";
    }
    case ObjKind::Module: return "<module '" + static_cast<const ModuleObj*>(obj)->name + "'>";
    case ObjKind::Frame: return "<frame>";
    case ObjKind::Native: return static_cast<const NativeObject*>(obj)->repr();
  }
  return "<object>";
}

std::string str(const Value& v) {
  if (const auto* s = v.as<StrObj>()) { return s->value; }
  if (const auto* e = v.as<ExceptionObj>()) { return exceptionMessage(*e); }
  if (const auto* n = v.as<NativeObject>()) { return n->str(); }
  return repr(v);
}

} // namespace pybox::rt
