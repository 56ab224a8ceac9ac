/***
 * Name: pybox::rt::detail method tables
 * Purpose: Native methods of the built-in value types, one table per type.
 * Theory of Operation:
 *   builtinAttr() finds the entry by name and binds the receiver. Calling the
 *   method through the type object (str.upper("x")) passes the receiver as the
 *   first positional argument instead.
 */
#pragma once

#include <vector>

#include "runtime/Value.h"

namespace pybox::rt {

class Interpreter;

namespace detail {

using MethodFn = Value (*)(Interpreter& interp, const Value& self, CallArgs& args);

struct MethodEntry {
  const char* name;
  MethodFn fn;
};

const std::vector<MethodEntry>& strMethods();
const std::vector<MethodEntry>& bytesMethods();
const std::vector<MethodEntry>& listMethods();
const std::vector<MethodEntry>& tupleMethods();
const std::vector<MethodEntry>& dictMethods();
const std::vector<MethodEntry>& setMethods();

} // namespace detail

} // namespace pybox::rt
