/***
 * Name: pybox::rt::builtinTypes
 * Purpose: Create the process-wide built-in type objects and exception hierarchy.
 * Theory of Operation:
 *   Built once (function-local static) with std::make_shared so no
 *   interpreter heap ever tracks or releases them.
 */
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "runtime/Builtins.h"
#include "runtime/TypeObject.h"

namespace pybox::rt {

namespace {

TypePtr newType(std::string name, TypePtr base, NativeFn ctor = {}) {
  return std::make_shared<TypeObject>(std::move(name), std::move(base), std::move(ctor));
}

BuiltinTypes createTypes() {
  BuiltinTypes t;
  t.object = newType("object", nullptr, &detail::constructObject);
  t.noneType = newType("NoneType", t.object);
  t.intType = newType("int", t.object, &detail::constructInt);
  t.boolType = newType("bool", t.intType, &detail::constructBool);
  t.floatType = newType("float", t.object, &detail::constructFloat);
  t.strType = newType("str", t.object, &detail::constructStr);
  t.bytesType = newType("bytes", t.object);
  t.listType = newType("list", t.object, &detail::constructList);
  t.tupleType = newType("tuple", t.object, &detail::constructTuple);
  t.dictType = newType("dict", t.object, &detail::constructDict);
  t.setType = newType("set", t.object, &detail::constructSet);
  t.rangeType = newType("range", t.object, &detail::constructRange);
  t.sliceType = newType("slice", t.object);
  t.iteratorType = newType("iterator", t.object);
  t.functionType = newType("function", t.object);
  t.builtinFunctionType = newType("builtin_function_or_method", t.object);
  t.coroutineType = newType("coroutine", t.object);
  t.typeType = newType("type", t.object, &detail::constructType);
  t.moduleType = newType("module", t.object);

  // Exception constructors are generic; the interpreter builds the instance.
  t.baseException = newType("BaseException", t.object);
  t.exception = newType("Exception", t.baseException);
  t.arithmeticError = newType("ArithmeticError", t.exception);
  t.zeroDivisionError = newType("ZeroDivisionError", t.arithmeticError);
  t.overflowError = newType("OverflowError", t.arithmeticError);
  t.lookupError = newType("LookupError", t.exception);
  t.keyError = newType("KeyError", t.lookupError);
  t.indexError = newType("IndexError", t.lookupError);
  t.valueError = newType("ValueError", t.exception);
  t.typeError = newType("TypeError", t.exception);
  t.attributeError = newType("AttributeError", t.exception);
  t.nameError = newType("NameError", t.exception);
  t.unboundLocalError = newType("UnboundLocalError", t.nameError);
  t.runtimeError = newType("RuntimeError", t.exception);
  t.recursionError = newType("RecursionError", t.runtimeError);
  t.notImplementedError = newType("NotImplementedError", t.runtimeError);
  t.stopIteration = newType("StopIteration", t.exception);
  t.assertionError = newType("AssertionError", t.exception);
  t.memoryError = newType("MemoryError", t.exception);
  t.osError = newType("OSError", t.exception);
  t.timeoutError = newType("TimeoutError", t.osError);
  return t;
}

} // namespace

const BuiltinTypes& builtinTypes() {
  static const BuiltinTypes types = createTypes();
  return types;
}

std::vector<std::pair<std::string, TypePtr>> exposedExceptionTypes() {
  const BuiltinTypes& t = builtinTypes();
  return {
      {"Exception", t.exception},
      {"ValueError", t.valueError},
      {"TypeError", t.typeError},
      {"KeyError", t.keyError},
      {"IndexError", t.indexError},
      {"StopIteration", t.stopIteration},
      {"RuntimeError", t.runtimeError},
      {"AttributeError", t.attributeError},
      {"NameError", t.nameError},
      {"ZeroDivisionError", t.zeroDivisionError},
      {"TimeoutError", t.timeoutError},
  };
}

} // namespace pybox::rt
