/***
 * Name: pybox::rt::detail::ArgReader (implementation)
 */
#include "runtime/detail/ArgReader.h"

#include "runtime/Objects.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"

namespace pybox::rt::detail {

namespace {

std::string arguments(std::size_t n) { return std::to_string(n) + (n == 1 ? " argument" : " arguments"); }

} // namespace

void ArgReader::expect(std::size_t min, std::size_t max) const {
  const std::size_t n = count();
  if (n >= min && n <= max) { return; }
  if (min == max) {
    if (min == 0) { raise(builtinTypes().typeError, function_ + "() takes no arguments (" + std::to_string(n) + " given)"); }
    raise(builtinTypes().typeError, function_ + "() takes exactly " + arguments(min) + " (" + std::to_string(n) + " given)");
  }
  if (n < min) {
    raise(builtinTypes().typeError, function_ + " expected at least " + arguments(min) + ", got " + std::to_string(n));
  }
  raise(builtinTypes().typeError, function_ + " expected at most " + arguments(max) + ", got " + std::to_string(n));
}

void ArgReader::noKeywords() const {
  if (!args_.keywords.empty()) { raise(builtinTypes().typeError, function_ + "() takes no keyword arguments"); }
}

std::optional<Value> ArgReader::keyword(const std::string& name) {
  auto& kws = args_.keywords;
  for (auto it = kws.begin(); it != kws.end(); ++it) {
    if (it->first == name) {
      Value v = std::move(it->second);
      kws.erase(it);
      return v;
    }
  }
  return std::nullopt;
}

std::optional<Value> ArgReader::argument(std::size_t i, const std::string& name) {
  auto kw = keyword(name);
  if (has(i)) {
    if (kw) {
      raise(builtinTypes().typeError, function_ + "() got multiple values for argument '" + name + "'");
    }
    return at(i);
  }
  return kw;
}

void ArgReader::finish() const {
  if (args_.keywords.empty()) { return; }
  raise(builtinTypes().typeError,
        "'" + args_.keywords.front().first + "' is an invalid keyword argument for " + function_ + "()");
}

long long ArgReader::integer(std::size_t i) const { return toInteger(at(i)); }

double ArgReader::number(std::size_t i) const { return toNumber(at(i), function_); }

const std::string& ArgReader::string(std::size_t i) const { return toString(at(i), function_); }

long long toInteger(const Value& v) {
  if (v.isIntegral()) { return v.asInt(); }
  raise(builtinTypes().typeError, "'" + typeName(v) + "' object cannot be interpreted as an integer");
}

double toNumber(const Value& v, const std::string& what) {
  if (v.isNumber()) { return v.asFloat(); }
  raise(builtinTypes().typeError, what + "() argument must be a real number, not '" + typeName(v) + "'");
}

const std::string& toString(const Value& v, const std::string& what) {
  if (const auto* s = v.as<StrObj>()) { return s->value; }
  raise(builtinTypes().typeError, what + "() argument must be str, not " + typeName(v));
}

} // namespace pybox::rt::detail
