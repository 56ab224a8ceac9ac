/***
 * Name: pybox::rt builtins
 * Purpose: Built-in functions, type constructors, methods of built-in types and the random/math modules.
 * Theory of Operation:
 *   Everything here is native code reached through BuiltinFunction objects.
 *   builtinFunctions() lists the callable names a fragment namespace gets;
 *   builtinAttr() resolves methods on str, list, dict and the other built-in
 *   types, binding the receiver into the returned function.
 */
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "runtime/Value.h"

namespace pybox::rt {

class Interpreter;

// print, len, range, ... in namespace order. Type constructors (list, str,
// int, ...) are included as their type objects.
std::vector<std::pair<std::string, Value>> builtinFunctions();

Value makeRandomModule();
Value makeMathModule();

std::optional<Value> builtinAttr(Interpreter& interp, const Value& obj, const std::string& name);
std::vector<std::string> builtinAttrNames(const Value& obj);

// format(value, spec) as used by f-strings and str.format.
std::string formatWithSpec(Interpreter& interp, const Value& v, const std::string& spec);
// printf-style `str % args`.
std::string percentFormat(const std::string& fmt, const Value& args);

namespace detail {
Value constructBool(Interpreter& interp, CallArgs& args);
Value constructInt(Interpreter& interp, CallArgs& args);
Value constructFloat(Interpreter& interp, CallArgs& args);
Value constructStr(Interpreter& interp, CallArgs& args);
Value constructList(Interpreter& interp, CallArgs& args);
Value constructTuple(Interpreter& interp, CallArgs& args);
Value constructDict(Interpreter& interp, CallArgs& args);
Value constructSet(Interpreter& interp, CallArgs& args);
Value constructRange(Interpreter& interp, CallArgs& args);
Value constructType(Interpreter& interp, CallArgs& args);
Value constructObject(Interpreter& interp, CallArgs& args);

// Stable sort by key (None sorts the items themselves); raises TypeError on unordered pairs.
void sortValues(Interpreter& interp, ValueList& items, const Value& key, bool reverse);
// str.format(*args, **kwargs).
std::string formatString(Interpreter& interp, const std::string& fmt, CallArgs& args);

// Parse an int from text in the given base (0 = infer from prefix); nullopt when malformed.
std::optional<long long> parseIntText(const std::string& text, int base);
std::optional<double> parseFloatText(const std::string& text);
} // namespace detail

} // namespace pybox::rt
