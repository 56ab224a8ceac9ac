/***
 * Name: pybox::rt::TypeObject
 * Purpose: Runtime type objects, exception instances and the built-in type registry.
 * Theory of Operation:
 *   A type has a name, a single base and an optional native constructor.
 *   isinstance() and `except` matching walk the base chain. Enumerations and
 *   domain types attach class-level members (Direction.N, SkillResult.stopped).
 *   The built-in registry is created once per process and never mutated
 *   afterwards, so concurrent sandboxes can share it.
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "runtime/Object.h"
#include "runtime/Value.h"

namespace pybox::rt {

class Interpreter;
struct TypeObject;
using TypePtr = std::shared_ptr<TypeObject>;
using NativeFn = std::function<Value(Interpreter&, CallArgs&)>;

struct TypeObject final : Object {
  std::string name;
  TypePtr base;
  NativeFn construct; // empty when the type cannot be called
  std::vector<std::pair<std::string, Value>> members;
  bool isEnum{false};

  TypeObject(std::string n, TypePtr b, NativeFn ctor = {})
      : Object(ObjKind::Type), name(std::move(n)), base(std::move(b)), construct(std::move(ctor)) {}

  bool isSubtypeOf(const TypeObject* other) const {
    for (const TypeObject* t = this; t != nullptr; t = t->base.get()) {
      if (t == other) { return true; }
    }
    return false;
  }

  const Value* findMember(const std::string& attr) const {
    for (const auto& [k, v] : members) {
      if (k == attr) { return &v; }
    }
    return nullptr;
  }

  void releaseReferences() override { members.clear(); }
};

struct ExceptionObj final : Object {
  TypePtr type;
  ValueList args;
  Value cause;
  ExceptionObj(TypePtr t, ValueList a) : Object(ObjKind::Exception), type(std::move(t)), args(std::move(a)) {}
  void releaseReferences() override {
    args.clear();
    cause = Value();
  }
};

struct BuiltinTypes {
  TypePtr object, noneType, boolType, intType, floatType, strType, bytesType;
  TypePtr listType, tupleType, dictType, setType, rangeType, sliceType, iteratorType;
  TypePtr functionType, builtinFunctionType, coroutineType, typeType, moduleType;

  TypePtr baseException, exception, arithmeticError, zeroDivisionError, overflowError;
  TypePtr lookupError, keyError, indexError, valueError, typeError, attributeError;
  TypePtr nameError, unboundLocalError, runtimeError, recursionError, notImplementedError;
  TypePtr stopIteration, assertionError, memoryError, osError, timeoutError;
};

const BuiltinTypes& builtinTypes();

// Exception types script code may name directly, in namespace order.
std::vector<std::pair<std::string, TypePtr>> exposedExceptionTypes();

} // namespace pybox::rt
