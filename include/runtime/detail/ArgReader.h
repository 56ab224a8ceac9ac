/***
 * Name: pybox::rt::detail::ArgReader
 * Purpose: Argument checking for native functions and methods.
 * Theory of Operation:
 *   Wraps one call's CallArgs. Positional accessors convert with the
 *   TypeError text Python uses; keyword() consumes a keyword so finish() can
 *   reject whatever is left over.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "runtime/Value.h"

namespace pybox::rt::detail {

class ArgReader {
 public:
  ArgReader(std::string function, CallArgs& args) : function_(std::move(function)), args_(args) {}

  std::size_t count() const { return args_.positional.size(); }
  bool has(std::size_t i) const { return i < args_.positional.size(); }
  const Value& at(std::size_t i) const { return args_.positional[i]; }
  ValueList& positional() { return args_.positional; }
  const std::string& function() const { return function_; }

  // TypeError unless min <= count() <= max.
  void expect(std::size_t min, std::size_t max) const;
  void noKeywords() const;
  // Removes and returns the named keyword argument.
  std::optional<Value> keyword(const std::string& name);
  // Positional argument i, or the keyword of the same name.
  std::optional<Value> argument(std::size_t i, const std::string& name);
  // TypeError when unconsumed keywords remain.
  void finish() const;

  long long integer(std::size_t i) const;
  double number(std::size_t i) const;
  const std::string& string(std::size_t i) const;

 private:
  std::string function_;
  CallArgs& args_;
};

// Conversions shared with the builtins; `what` names the callee in messages.
long long toInteger(const Value& v);
double toNumber(const Value& v, const std::string& what);
const std::string& toString(const Value& v, const std::string& what);

} // namespace pybox::rt::detail
