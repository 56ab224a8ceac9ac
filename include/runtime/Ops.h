/***
 * Name: pybox::rt operations
 * Purpose: Value semantics that never call back into script code.
 * Theory of Operation:
 *   Truthiness, repr/str, equality, hashing, ordering, arithmetic, container
 *   indexing and iteration over built-in types. Failures raise ScriptError
 *   with the Python exception type a script would see (TypeError,
 *   ZeroDivisionError, IndexError, KeyError, OverflowError). 64-bit integer
 *   overflow is reported rather than promoted.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ast/BinaryOperator.h"
#include "ast/UnaryOperator.h"
#include "runtime/Objects.h"
#include "runtime/TypeObject.h"
#include "runtime/Value.h"

namespace pybox::rt {

// Constructors for common values.
Value newStr(std::string s);
Value newList(ValueList items = {});
Value newTuple(ValueList items = {});
Value newDict();
Value newSet();

TypePtr typeOf(const Value& v);
std::string typeName(const Value& v);
bool isInstance(const Value& v, const TypeObject* type);

bool truthy(const Value& v);
std::string repr(const Value& v);
std::string str(const Value& v);
std::string reprString(const std::string& s);
std::string formatFloat(double d);

bool equals(const Value& a, const Value& b);
std::size_t hashValue(const Value& v);
// Raises TypeError when the pair has no ordering.
bool lessThan(const Value& a, const Value& b);

Value binaryOp(ast::BinaryOperator op, const Value& a, const Value& b);
// In-place variant used by augmented assignment: lists extend in place.
Value inplaceOp(ast::BinaryOperator op, const Value& a, const Value& b);
Value unaryOp(ast::UnaryOperator op, const Value& v);
// Eq, Ne, Lt, Le, Gt, Ge, In, NotIn, Is, IsNot.
bool compareOp(ast::BinaryOperator op, const Value& a, const Value& b);
bool contains(const Value& container, const Value& item);

Value getItem(const Value& container, const Value& index);
void setItem(const Value& container, const Value& index, const Value& value);
void delItem(const Value& container, const Value& index);
long long length(const Value& v);

// Iterator protocol over built-in iterables; raises TypeError otherwise.
Value getIter(const Value& iterable);
std::optional<Value> iterNext(const Value& iterator);

// Checked 64-bit integer helpers (OverflowError on overflow).
long long checkedAdd(long long a, long long b);
long long checkedSub(long long a, long long b);
long long checkedMul(long long a, long long b);
long long floorDiv(long long a, long long b);
long long floorMod(long long a, long long b);

// Normalise a Python index against a length; raises IndexError when out of range.
std::size_t normalizeIndex(long long index, std::size_t len, const char* what);
long long indexValue(const Value& v, const char* what);

struct SliceBounds {
  long long start;
  long long stop;
  long long step;
  long long count;
};
SliceBounds sliceBounds(const SliceObj& slice, long long len);

} // namespace pybox::rt
