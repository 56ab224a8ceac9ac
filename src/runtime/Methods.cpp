/***
 * Name: pybox::rt::builtinAttr
 * Purpose: Attribute lookup on built-in values: bound methods and data attributes.
 */
#include <cmath>
#include <string>
#include <utility>

#include "runtime/Builtins.h"
#include "runtime/Callable.h"
#include "runtime/Heap.h"
#include "runtime/Interpreter.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/detail/ArgReader.h"
#include "runtime/detail/Methods.h"

namespace pybox::rt {

namespace {

using detail::MethodEntry;

const std::vector<MethodEntry>* methodsFor(const TypeObject* type) {
  const BuiltinTypes& t = builtinTypes();
  if (type == t.strType.get()) { return &detail::strMethods(); }
  if (type == t.bytesType.get()) { return &detail::bytesMethods(); }
  if (type == t.listType.get()) { return &detail::listMethods(); }
  if (type == t.tupleType.get()) { return &detail::tupleMethods(); }
  if (type == t.dictType.get()) { return &detail::dictMethods(); }
  if (type == t.setType.get()) { return &detail::setMethods(); }
  return nullptr;
}

const MethodEntry* findMethod(const TypeObject* type, const std::string& name) {
  const auto* table = methodsFor(type);
  if (table == nullptr) { return nullptr; }
  for (const auto& m : *table) {
    if (name == m.name) { return &m; }
  }
  return nullptr;
}

Value bindMethod(const Value& receiver, const MethodEntry& method) {
  detail::MethodFn fn = method.fn;
  return make<BuiltinFunction>(method.name,
                               [fn, receiver](Interpreter& interp, CallArgs& args) { return fn(interp, receiver, args); },
                               receiver);
}

// `str.upper` reached through the type: the receiver is the first argument.
Value unboundMethod(const TypePtr& type, const MethodEntry& method) {
  detail::MethodFn fn = method.fn;
  const std::string qualified = type->name + "." + method.name;
  const TypeObject* owner = type.get();
  return make<BuiltinFunction>(qualified, [fn, qualified, owner, name = std::string(method.name)](Interpreter& interp,
                                                                                                  CallArgs& args) {
    if (args.positional.empty()) {
      raise(builtinTypes().typeError, "unbound method " + qualified + "() needs an argument");
    }
    Value receiver = args.positional.front();
    if (typeOf(receiver).get() != owner) {
      raise(builtinTypes().typeError, "descriptor '" + name + "' for '" + owner->name + "' objects doesn't apply to a '" +
                                          typeName(receiver) + "' object");
    }
    args.positional.erase(args.positional.begin());
    return fn(interp, receiver, args);
  });
}

Value dictFromkeys(Interpreter& interp, CallArgs& args) {
  detail::ArgReader r("fromkeys", args);
  r.noKeywords();
  r.expect(1, 2);
  const Value fill = r.has(1) ? r.at(1) : Value();
  Value out = newDict();
  auto& table = out.as<DictObj>()->table;
  interp.iterate(r.at(0), [&](const Value& key) {
    Heap::checkLength(table.size() + 1);
    table.insert(key, fill);
    return true;
  });
  return out;
}

std::optional<Value> numberAttr(const Value& obj, const std::string& name) {
  if (name == "real") { return obj.isBool() ? Value::integer(obj.asInt()) : obj; }
  if (name == "imag") { return obj.isFloat() ? Value::real(0.0) : Value::integer(0); }
  if (obj.isIntegral() && name == "bit_length") {
    const long long v = obj.asInt();
    return make<BuiltinFunction>("bit_length", [v](Interpreter&, CallArgs& args) {
      detail::ArgReader r("bit_length", args);
      r.noKeywords();
      r.expect(0, 0);
      unsigned long long mag = v < 0 ? 0ULL - static_cast<unsigned long long>(v) : static_cast<unsigned long long>(v);
      long long bits = 0;
      while (mag != 0) {
        ++bits;
        mag >>= 1U;
      }
      return Value::integer(bits);
    }, obj);
  }
  if (obj.isFloat() && name == "is_integer") {
    const double d = obj.asFloat();
    return make<BuiltinFunction>("is_integer", [d](Interpreter&, CallArgs& args) {
      detail::ArgReader r("is_integer", args);
      r.noKeywords();
      r.expect(0, 0);
      return Value::boolean(std::isfinite(d) && std::floor(d) == d);
    }, obj);
  }
  return std::nullopt;
}

} // namespace

std::optional<Value> builtinAttr(Interpreter& interp, const Value& obj, const std::string& name) {
  (void)interp;
  if (obj.isNumber()) { return numberAttr(obj, name); }
  if (const auto* type = obj.as<TypeObject>()) {
    if (type == builtinTypes().dictType.get() && name == "fromkeys") {
      return make<BuiltinFunction>("dict.fromkeys", &dictFromkeys);
    }
    if (const auto* m = findMethod(type, name)) { return unboundMethod(obj.share<TypeObject>(), *m); }
    return std::nullopt;
  }
  if (const auto* exc = obj.as<ExceptionObj>()) {
    if (name == "args") { return newTuple(exc->args); }
    return std::nullopt;
  }
  if (const auto* range = obj.as<RangeObj>()) {
    if (name == "start") { return Value::integer(range->start); }
    if (name == "stop") { return Value::integer(range->stop); }
    if (name == "step") { return Value::integer(range->step); }
    return std::nullopt;
  }
  if (const auto* m = findMethod(typeOf(obj).get(), name)) { return bindMethod(obj, *m); }
  return std::nullopt;
}

std::vector<std::string> builtinAttrNames(const Value& obj) {
  std::vector<std::string> names;
  if (obj.isNumber()) {
    names = {"imag", "real"};
    if (obj.isIntegral()) { names.emplace_back("bit_length"); }
    if (obj.isFloat()) { names.emplace_back("is_integer"); }
    return names;
  }
  if (obj.as<ExceptionObj>() != nullptr) { return {"args"}; }
  if (obj.as<RangeObj>() != nullptr) { return {"start", "step", "stop"}; }
  const TypeObject* type = obj.as<TypeObject>();
  if (type == nullptr) { type = typeOf(obj).get(); }
  if (const auto* table = methodsFor(type)) {
    for (const auto& m : *table) { names.emplace_back(m.name); }
  }
  if (type == builtinTypes().dictType.get() && obj.as<TypeObject>() != nullptr) { names.emplace_back("fromkeys"); }
  return names;
}

} // namespace pybox::rt
