/***
 * Name: pybox::rt::Interpreter (calls, attributes, iteration)
 * Purpose: Call dispatch, argument binding, attribute lookup and the interrupt poll.
 */
#include "runtime/Interpreter.h"

#include <algorithm>
#include <random>
#include <string>
#include <unordered_set>
#include <utility>

#include "pybox/exceptions/timeout_failure.h"
#include "runtime/Builtins.h"
#include "runtime/Native.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"

namespace pybox::rt {

namespace {

std::string plural(std::size_t n, const char* word) {
  return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

std::string quotedList(const std::vector<std::string>& names) {
  std::string out;
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i != 0) { out += (i + 1 == names.size()) ? (names.size() > 2 ? ", and " : " and ") : ", "; }
    out += "'" + names[i] + "'";
  }
  return out;
}

} // namespace

Interpreter::Interpreter(InterpreterLimits limits)
    : limits_(limits), heapScope_(heap_), rng_(std::random_device{}()) {
  heap_.setMaxSequenceLength(limits_.maxSequenceLength);
}

Interpreter::~Interpreter() {
  handling_.clear();
  globals_.clear();
  builtins_.clear();
  heap_.releaseAll();
}

Interpreter::CallDepth::CallDepth(Interpreter& interp) : interp_(interp) {
  if (interp_.depth_ >= interp_.limits_.maxCallDepth) {
    raise(builtinTypes().recursionError, "maximum recursion depth exceeded");
  }
  ++interp_.depth_;
}

void Interpreter::setGlobal(const std::string& name, Value value) { globals_[name] = std::move(value); }

void Interpreter::setBuiltin(const std::string& name, Value value) { builtins_[name] = std::move(value); }

void Interpreter::installBuiltins() {
  for (auto& [name, value] : builtinFunctions()) { setBuiltin(name, std::move(value)); }
  for (auto& [name, type] : exposedExceptionTypes()) { setBuiltin(name, Value(type)); }
}

const Value* Interpreter::lookupGlobal(const std::string& name) const {
  auto it = globals_.find(name);
  return it == globals_.end() ? nullptr : &it->second;
}

std::vector<std::string> Interpreter::globalNames() const {
  std::vector<std::string> names;
  names.reserve(globals_.size());
  for (const auto& [name, value] : globals_) { names.push_back(name); }
  std::sort(names.begin(), names.end());
  return names;
}

Value Interpreter::currentException() const { return handling_.empty() ? Value() : handling_.back(); }

void Interpreter::poll() const {
  if (interrupt_ != nullptr && *interrupt_ != 0) { throw exceptions::TimeoutFailure("execution interrupted"); }
}

void Interpreter::execModule(const ast::Module& module) {
  Activation act;
  execBlock(module.body, act);
}

Value Interpreter::call(const Value& callee, CallArgs args) {
  poll();
  if (auto fn = callee.share<FunctionObj>()) {
    if (fn->isAsync) { return make<CoroutineObj>(fn, std::move(args)); }
    return runFunction(fn, std::move(args));
  }
  if (auto builtin = callee.share<BuiltinFunction>()) {
    CallDepth depth(*this);
    return builtin->fn(*this, args);
  }
  if (auto type = callee.share<TypeObject>()) {
    if (type->construct) {
      CallDepth depth(*this);
      return type->construct(*this, args);
    }
    if (type->isSubtypeOf(builtinTypes().baseException.get())) {
      if (!args.keywords.empty()) { raise(builtinTypes().typeError, type->name + "() takes no keyword arguments"); }
      return make<ExceptionObj>(type, std::move(args.positional));
    }
    raise(builtinTypes().typeError, "cannot create '" + type->name + "' instances");
  }
  raise(builtinTypes().typeError, "'" + typeName(callee) + "' object is not callable");
}

Value Interpreter::await(const Value& value) {
  auto coro = value.share<CoroutineObj>();
  if (!coro) { return value; }
  if (coro->awaited) { raise(builtinTypes().runtimeError, "cannot reuse already awaited coroutine"); }
  coro->awaited = true;
  auto fn = coro->fn;
  return runFunction(fn, std::move(coro->args));
}

Value Interpreter::runFunction(const std::shared_ptr<FunctionObj>& fn, CallArgs args) {
  CallDepth depth(*this);
  auto frame = make<Frame>(fn->scope, fn->closure);
  bindArguments(*fn, std::move(args), *frame);
  Activation act{frame, Value()};
  if (fn->lambda != nullptr) { return eval(*fn->lambda->body, act); }
  if (execBlock(fn->def->body, act) == Flow::Return) { return act.returnValue; }
  return Value();
}

void Interpreter::bindArguments(const FunctionObj& fn, CallArgs args, Frame& frame) {
  const auto& params = *fn.params;
  std::unordered_set<std::string> bound;
  std::size_t positionalCount = 0;
  const ast::Param* varArgs = nullptr;
  const ast::Param* kwArgs = nullptr;
  for (const auto& p : params) {
    if (p.kind == ast::ParamKind::Positional || p.kind == ast::ParamKind::PositionalOnly) { ++positionalCount; }
    if (p.kind == ast::ParamKind::VarArgs) { varArgs = &p; }
    if (p.kind == ast::ParamKind::KwArgs) { kwArgs = &p; }
  }

  const std::size_t given = args.positional.size();
  if (given > positionalCount && varArgs == nullptr) {
    raise(builtinTypes().typeError, fn.name + "() takes " + std::to_string(positionalCount) + " positional argument" +
                                        (positionalCount == 1 ? "" : "s") + " but " + std::to_string(given) +
                                        (given == 1 ? " was" : " were") + " given");
  }
  for (std::size_t i = 0; i < given && i < positionalCount; ++i) {
    frame.vars[params[i].name] = std::move(args.positional[i]);
    bound.insert(params[i].name);
  }
  if (varArgs != nullptr) {
    ValueList extra;
    for (std::size_t i = positionalCount; i < given; ++i) { extra.push_back(std::move(args.positional[i])); }
    frame.vars[varArgs->name] = newTuple(std::move(extra));
    bound.insert(varArgs->name);
  }

  Value extraKeywords;
  if (kwArgs != nullptr) {
    extraKeywords = newDict();
    frame.vars[kwArgs->name] = extraKeywords;
    bound.insert(kwArgs->name);
  }
  for (auto& [name, value] : args.keywords) {
    const ast::Param* target = nullptr;
    for (const auto& p : params) {
      if (p.name == name && (p.kind == ast::ParamKind::Positional || p.kind == ast::ParamKind::KeywordOnly)) {
        target = &p;
      }
    }
    if (target == nullptr) {
      if (kwArgs == nullptr) {
        raise(builtinTypes().typeError, fn.name + "() got an unexpected keyword argument '" + name + "'");
      }
      setItem(extraKeywords, newStr(name), value);
      continue;
    }
    if (!bound.insert(name).second) {
      raise(builtinTypes().typeError, fn.name + "() got multiple values for argument '" + name + "'");
    }
    frame.vars[name] = std::move(value);
  }

  std::vector<std::string> missingPositional;
  std::vector<std::string> missingKeyword;
  for (std::size_t i = 0; i < params.size(); ++i) {
    const auto& p = params[i];
    if (p.kind == ast::ParamKind::VarArgs || p.kind == ast::ParamKind::KwArgs || bound.count(p.name) != 0) { continue; }
    if (fn.defaults[i]) {
      frame.vars[p.name] = *fn.defaults[i];
    } else if (p.kind == ast::ParamKind::KeywordOnly) {
      missingKeyword.push_back(p.name);
    } else {
      missingPositional.push_back(p.name);
    }
  }
  if (!missingPositional.empty()) {
    raise(builtinTypes().typeError, fn.name + "() missing " +
                                        plural(missingPositional.size(), "required positional argument") + ": " +
                                        quotedList(missingPositional));
  }
  if (!missingKeyword.empty()) {
    raise(builtinTypes().typeError, fn.name + "() missing " +
                                        plural(missingKeyword.size(), "required keyword-only argument") + ": " +
                                        quotedList(missingKeyword));
  }
}

std::shared_ptr<const ScopeInfo> Interpreter::scopeFor(const ast::Node& node) {
  auto it = scopes_.find(&node);
  if (it != scopes_.end()) { return it->second; }
  auto info = analyzeScope(node);
  scopes_.emplace(&node, info);
  return info;
}

std::shared_ptr<FunctionObj> Interpreter::makeFunction(const ast::Node& node, const std::vector<ast::Param>& params,
                                                       Activation& act) {
  auto fn = make<FunctionObj>();
  fn->params = &params;
  fn->defaults.reserve(params.size());
  for (const auto& p : params) {
    if (p.defaultValue) {
      fn->defaults.emplace_back(eval(*p.defaultValue, act));
    } else {
      fn->defaults.emplace_back(std::nullopt);
    }
  }
  fn->closure = act.frame;
  fn->scope = scopeFor(node);
  return fn;
}

std::optional<Value> Interpreter::findAttr(const Value& obj, const std::string& name) {
  if (auto* native = obj.as<NativeObject>()) {
    if (auto v = native->getAttr(*this, obj, name)) { return v; }
    return std::nullopt;
  }
  if (const auto* module = obj.as<ModuleObj>()) {
    if (const Value* v = module->find(name)) { return *v; }
    return std::nullopt;
  }
  if (const auto* type = obj.as<TypeObject>()) {
    for (const TypeObject* t = type; t != nullptr; t = t->base.get()) {
      if (const Value* v = t->findMember(name)) { return *v; }
    }
  }
  return builtinAttr(*this, obj, name);
}

Value Interpreter::getAttr(const Value& obj, const std::string& name) {
  if (auto v = findAttr(obj, name)) { return *std::move(v); }
  if (const auto* module = obj.as<ModuleObj>()) {
    raise(builtinTypes().attributeError, "module '" + module->name + "' has no attribute '" + name + "'");
  }
  if (const auto* type = obj.as<TypeObject>()) {
    raise(builtinTypes().attributeError, "type object '" + type->name + "' has no attribute '" + name + "'");
  }
  raise(builtinTypes().attributeError, "'" + typeName(obj) + "' object has no attribute '" + name + "'");
}

void Interpreter::setAttr(const Value& obj, const std::string& name, const Value& value) {
  if (auto* native = obj.as<NativeObject>()) {
    if (native->setAttr(name, value)) { return; }
  }
  raise(builtinTypes().attributeError, "cannot set attribute '" + name + "' on '" + typeName(obj) + "' object");
}

void Interpreter::iterate(const Value& iterable, const std::function<bool(const Value&)>& fn) {
  const Value it = getIter(iterable);
  for (;;) {
    poll();
    auto next = iterNext(it);
    if (!next) { return; }
    if (!fn(*next)) { return; }
  }
}

ValueList Interpreter::materialize(const Value& iterable) {
  if (const auto* list = iterable.as<ListObj>()) { return list->items; }
  if (const auto* tuple = iterable.as<TupleObj>()) { return tuple->items; }
  ValueList out;
  iterate(iterable, [&](const Value& v) {
    Heap::checkLength(out.size() + 1);
    out.push_back(v);
    return true;
  });
  return out;
}

} // namespace pybox::rt
