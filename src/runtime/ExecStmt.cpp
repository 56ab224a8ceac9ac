/***
 * Name: pybox::rt::Interpreter (statements and names)
 * Purpose: Execute statements and resolve variable bindings.
 * Theory of Operation:
 *   exec() polls the interrupt flag and dispatches on the node kind.
 *   `try` runs its finally block when the body completes or raises a
 *   ScriptError; any other C++ exception (a timeout) passes straight through.
 *   A name is owned by the innermost frame whose scope lists it as local,
 *   skipping frames that declare it nonlocal or forward it (comprehension
 *   walrus targets); a `global` declaration or the end of the chain selects
 *   the module globals.
 */
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "runtime/Interpreter.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"

namespace pybox::rt {

namespace {

bool exceptionMatches(const ExceptionObj& exc, const Value& spec) {
  if (const auto* type = spec.as<TypeObject>()) {
    if (!type->isSubtypeOf(builtinTypes().baseException.get())) {
      raise(builtinTypes().typeError, "catching classes that do not inherit from BaseException is not allowed");
    }
    return exc.type->isSubtypeOf(type);
  }
  if (const auto* tuple = spec.as<TupleObj>()) {
    for (const auto& item : tuple->items) {
      if (exceptionMatches(exc, item)) { return true; }
    }
    return false;
  }
  raise(builtinTypes().typeError, "catching classes that do not inherit from BaseException is not allowed");
}

[[noreturn]] void unsupported(const std::string& what) { raise(builtinTypes().notImplementedError, what); }

} // namespace

Interpreter::Flow Interpreter::execBlock(const std::vector<std::unique_ptr<ast::Stmt>>& body, Activation& act) {
  for (const auto& stmt : body) {
    const Flow flow = exec(*stmt, act);
    if (flow != Flow::Normal) { return flow; }
  }
  return Flow::Normal;
}

Interpreter::Flow Interpreter::exec(const ast::Stmt& stmt, Activation& act) {
  poll();
  switch (stmt.kind) {
    case ast::NodeKind::ExprStmt: eval(*static_cast<const ast::ExprStmt&>(stmt).value, act); return Flow::Normal;
    case ast::NodeKind::AssignStmt: execAssign(static_cast<const ast::AssignStmt&>(stmt), act); return Flow::Normal;
    case ast::NodeKind::AugAssignStmt:
      execAugAssign(static_cast<const ast::AugAssignStmt&>(stmt), act);
      return Flow::Normal;
    case ast::NodeKind::IfStmt: return execIf(static_cast<const ast::IfStmt&>(stmt), act);
    case ast::NodeKind::WhileStmt: return execWhile(static_cast<const ast::WhileStmt&>(stmt), act);
    case ast::NodeKind::ForStmt: return execFor(static_cast<const ast::ForStmt&>(stmt), act);
    case ast::NodeKind::TryStmt: return execTry(static_cast<const ast::TryStmt&>(stmt), act);
    case ast::NodeKind::ReturnStmt: {
      const auto& r = static_cast<const ast::ReturnStmt&>(stmt);
      act.returnValue = r.value ? eval(*r.value, act) : Value();
      return Flow::Return;
    }
    case ast::NodeKind::BreakStmt: return Flow::Break;
    case ast::NodeKind::ContinueStmt: return Flow::Continue;
    case ast::NodeKind::PassStmt:
    case ast::NodeKind::GlobalStmt:
    case ast::NodeKind::NonlocalStmt: return Flow::Normal;
    case ast::NodeKind::FunctionDef:
      execFunctionDef(static_cast<const ast::FunctionDef&>(stmt), act);
      return Flow::Normal;
    case ast::NodeKind::RaiseStmt: execRaise(static_cast<const ast::RaiseStmt&>(stmt), act); return Flow::Normal;
    case ast::NodeKind::AssertStmt: {
      const auto& a = static_cast<const ast::AssertStmt&>(stmt);
      if (!truthy(eval(*a.test, act))) {
        ValueList args;
        if (a.msg) { args.push_back(eval(*a.msg, act)); }
        throw ScriptError(make<ExceptionObj>(builtinTypes().assertionError, std::move(args)));
      }
      return Flow::Normal;
    }
    case ast::NodeKind::DelStmt:
      for (const auto& target : static_cast<const ast::DelStmt&>(stmt).targets) { execDelete(*target, act); }
      return Flow::Normal;
    case ast::NodeKind::ClassDef: unsupported("class definitions are not supported");
    case ast::NodeKind::WithStmt: unsupported("'with' statements are not supported");
    case ast::NodeKind::Import:
    case ast::NodeKind::ImportFrom: unsupported("import statements are not available");
    default: unsupported(std::string("unsupported statement: ") + ast::to_string(stmt.kind));
  }
}

Interpreter::Flow Interpreter::execIf(const ast::IfStmt& s, Activation& act) {
  if (truthy(eval(*s.cond, act))) { return execBlock(s.thenBody, act); }
  return execBlock(s.elseBody, act);
}

Interpreter::Flow Interpreter::execWhile(const ast::WhileStmt& s, Activation& act) {
  for (;;) {
    poll();
    if (!truthy(eval(*s.cond, act))) { return execBlock(s.elseBody, act); }
    const Flow flow = execBlock(s.thenBody, act);
    if (flow == Flow::Break) { return Flow::Normal; }
    if (flow == Flow::Return) { return flow; }
  }
}

Interpreter::Flow Interpreter::execFor(const ast::ForStmt& s, Activation& act) {
  if (s.isAsync) { unsupported("'async for' is not supported"); }
  const Value iterable = eval(*s.iterable, act);
  bool broke = false;
  bool returned = false;
  iterate(iterable, [&](const Value& item) {
    assign(*s.target, item, act);
    const Flow flow = execBlock(s.thenBody, act);
    if (flow == Flow::Break) {
      broke = true;
      return false;
    }
    if (flow == Flow::Return) {
      returned = true;
      return false;
    }
    return true;
  });
  if (returned) { return Flow::Return; }
  if (broke) { return Flow::Normal; }
  return execBlock(s.elseBody, act);
}

Interpreter::Flow Interpreter::execTry(const ast::TryStmt& s, Activation& act) {
  auto guarded = [&]() -> Flow {
    Flow flow = Flow::Normal;
    try {
      flow = execBlock(s.body, act);
    } catch (const ScriptError& err) {
      const std::shared_ptr<ExceptionObj> exc = err.exception();
      for (const auto& handler : s.handlers) {
        if (handler->type && !exceptionMatches(*exc, eval(*handler->type, act))) { continue; }
        handling_.push_back(Value(exc));
        struct Handling {
          std::vector<Value>& stack;
          ~Handling() { stack.pop_back(); }
        } handling{handling_};
        if (!handler->name.empty()) { storeName(handler->name, Value(exc), act); }
        return execBlock(handler->body, act);
      }
      throw;
    }
    if (flow != Flow::Normal) { return flow; }
    return execBlock(s.orelse, act);
  };

  Flow flow = Flow::Normal;
  try {
    flow = guarded();
  } catch (const ScriptError&) {
    const Flow cleanup = execBlock(s.finalbody, act);
    if (cleanup != Flow::Normal) { return cleanup; }
    throw;
  }
  const Flow cleanup = execBlock(s.finalbody, act);
  return cleanup != Flow::Normal ? cleanup : flow;
}

void Interpreter::execFunctionDef(const ast::FunctionDef& def, Activation& act) {
  ValueList decorators;
  for (const auto& d : def.decorators) { decorators.push_back(eval(*d, act)); }
  auto fn = makeFunction(def, def.params, act);
  fn->name = def.name;
  fn->def = &def;
  fn->isAsync = def.isAsync;
  Value result = fn;
  for (auto it = decorators.rbegin(); it != decorators.rend(); ++it) {
    CallArgs args;
    args.positional.push_back(result);
    result = call(*it, std::move(args));
  }
  storeName(def.name, std::move(result), act);
}

void Interpreter::execAssign(const ast::AssignStmt& s, Activation& act) {
  if (!s.value) { return; }
  const Value value = eval(*s.value, act);
  for (const auto& target : s.targets) { assign(*target, value, act); }
}

void Interpreter::execAugAssign(const ast::AugAssignStmt& s, Activation& act) {
  const ast::Expr& target = *s.target;
  switch (target.kind) {
    case ast::NodeKind::Name: {
      const auto& name = static_cast<const ast::Name&>(target).id;
      const Value current = loadName(name, act);
      storeName(name, inplaceOp(s.op, current, eval(*s.value, act)), act);
      return;
    }
    case ast::NodeKind::Attribute: {
      const auto& attr = static_cast<const ast::Attribute&>(target);
      const Value obj = eval(*attr.value, act);
      const Value current = getAttr(obj, attr.attr);
      setAttr(obj, attr.attr, inplaceOp(s.op, current, eval(*s.value, act)));
      return;
    }
    case ast::NodeKind::Subscript: {
      const auto& sub = static_cast<const ast::Subscript&>(target);
      const Value container = eval(*sub.value, act);
      const Value index = evalSubscriptIndex(*sub.slice, act);
      const Value current = getItem(container, index);
      setItem(container, index, inplaceOp(s.op, current, eval(*s.value, act)));
      return;
    }
    default: raise(builtinTypes().typeError, "illegal expression for augmented assignment");
  }
}

Value Interpreter::makeExceptionValue(const Value& v) {
  if (const auto* type = v.as<TypeObject>()) {
    if (type->isSubtypeOf(builtinTypes().baseException.get())) { return call(v, CallArgs{}); }
  }
  if (v.as<ExceptionObj>() != nullptr) { return v; }
  raise(builtinTypes().typeError, "exceptions must derive from BaseException");
}

void Interpreter::execRaise(const ast::RaiseStmt& s, Activation& act) {
  if (!s.exc) {
    if (handling_.empty()) { raise(builtinTypes().runtimeError, "No active exception to reraise"); }
    throw ScriptError(handling_.back().share<ExceptionObj>());
  }
  auto exc = makeExceptionValue(eval(*s.exc, act)).share<ExceptionObj>();
  if (s.cause) {
    const Value cause = eval(*s.cause, act);
    exc->cause = cause.isNone() ? Value() : makeExceptionValue(cause);
  }
  throw ScriptError(exc);
}

void Interpreter::assign(const ast::Expr& target, const Value& value, Activation& act) {
  switch (target.kind) {
    case ast::NodeKind::Name: storeName(static_cast<const ast::Name&>(target).id, value, act); return;
    case ast::NodeKind::Attribute: {
      const auto& attr = static_cast<const ast::Attribute&>(target);
      setAttr(eval(*attr.value, act), attr.attr, value);
      return;
    }
    case ast::NodeKind::Subscript: {
      const auto& sub = static_cast<const ast::Subscript&>(target);
      const Value container = eval(*sub.value, act);
      setItem(container, evalSubscriptIndex(*sub.slice, act), value);
      return;
    }
    case ast::NodeKind::TupleLiteral:
    case ast::NodeKind::ListLiteral: {
      const auto& elements = target.kind == ast::NodeKind::TupleLiteral
                                 ? static_cast<const ast::TupleLiteral&>(target).elements
                                 : static_cast<const ast::ListLiteral&>(target).elements;
      if (value.isNumber() || value.isNone()) {
        raise(builtinTypes().typeError, "cannot unpack non-iterable " + typeName(value) + " object");
      }
      const ValueList items = materialize(value);
      std::size_t starAt = elements.size();
      for (std::size_t i = 0; i < elements.size(); ++i) {
        if (elements[i]->kind == ast::NodeKind::Starred) { starAt = i; }
      }
      if (starAt == elements.size()) {
        if (items.size() > elements.size()) {
          raise(builtinTypes().valueError,
                "too many values to unpack (expected " + std::to_string(elements.size()) + ")");
        }
        if (items.size() < elements.size()) {
          raise(builtinTypes().valueError, "not enough values to unpack (expected " +
                                               std::to_string(elements.size()) + ", got " +
                                               std::to_string(items.size()) + ")");
        }
        for (std::size_t i = 0; i < elements.size(); ++i) { assign(*elements[i], items[i], act); }
        return;
      }
      const std::size_t fixed = elements.size() - 1;
      if (items.size() < fixed) {
        raise(builtinTypes().valueError, "not enough values to unpack (expected at least " + std::to_string(fixed) +
                                             ", got " + std::to_string(items.size()) + ")");
      }
      const std::size_t tail = elements.size() - starAt - 1;
      for (std::size_t i = 0; i < starAt; ++i) { assign(*elements[i], items[i], act); }
      ValueList middle(items.begin() + static_cast<std::ptrdiff_t>(starAt),
                       items.end() - static_cast<std::ptrdiff_t>(tail));
      assign(*static_cast<const ast::Starred&>(*elements[starAt]).value, newList(std::move(middle)), act);
      for (std::size_t i = 0; i < tail; ++i) {
        assign(*elements[starAt + 1 + i], items[items.size() - tail + i], act);
      }
      return;
    }
    default: raise(builtinTypes().typeError, "cannot assign to expression");
  }
}

void Interpreter::execDelete(const ast::Expr& target, Activation& act) {
  switch (target.kind) {
    case ast::NodeKind::Name: deleteName(static_cast<const ast::Name&>(target).id, act); return;
    case ast::NodeKind::Subscript: {
      const auto& sub = static_cast<const ast::Subscript&>(target);
      const Value container = eval(*sub.value, act);
      delItem(container, evalSubscriptIndex(*sub.slice, act));
      return;
    }
    case ast::NodeKind::TupleLiteral:
      for (const auto& e : static_cast<const ast::TupleLiteral&>(target).elements) { execDelete(*e, act); }
      return;
    case ast::NodeKind::ListLiteral:
      for (const auto& e : static_cast<const ast::ListLiteral&>(target).elements) { execDelete(*e, act); }
      return;
    case ast::NodeKind::Attribute: {
      const auto& attr = static_cast<const ast::Attribute&>(target);
      const Value obj = eval(*attr.value, act);
      raise(builtinTypes().attributeError, "cannot delete attribute '" + attr.attr + "' of '" + typeName(obj) +
                                               "' object");
    }
    default: raise(builtinTypes().typeError, "cannot delete expression");
  }
}

Frame* Interpreter::owningFrame(const std::string& name, Frame* start) {
  for (Frame* f = start; f != nullptr; f = f->parent.get()) {
    const ScopeInfo& scope = *f->scope;
    if (scope.globals.count(name) != 0) { return nullptr; }
    if (scope.locals.count(name) != 0) { return f; }
    if (scope.nonlocals.count(name) == 0 && scope.forwarded.count(name) == 0) { return f; }
  }
  return nullptr;
}

Value Interpreter::loadName(const std::string& name, const Activation& act) {
  if (Frame* f = act.frame.get()) {
    const ScopeInfo& scope = *f->scope;
    if (scope.globals.count(name) == 0) {
      if (scope.locals.count(name) != 0) {
        auto it = f->vars.find(name);
        if (it != f->vars.end()) { return it->second; }
        raise(builtinTypes().unboundLocalError, "local variable '" + name + "' referenced before assignment");
      }
      for (Frame* p = f->parent.get(); p != nullptr; p = p->parent.get()) {
        const ScopeInfo& outer = *p->scope;
        if (outer.globals.count(name) != 0) { break; }
        if (outer.locals.count(name) != 0) {
          auto it = p->vars.find(name);
          if (it != p->vars.end()) { return it->second; }
          raise(builtinTypes().nameError,
                "free variable '" + name + "' referenced before assignment in enclosing scope");
        }
      }
    }
  }
  if (auto it = globals_.find(name); it != globals_.end()) { return it->second; }
  if (auto it = builtins_.find(name); it != builtins_.end()) { return it->second; }
  raise(builtinTypes().nameError, "name '" + name + "' is not defined");
}

void Interpreter::storeName(const std::string& name, Value value, Activation& act) {
  if (Frame* owner = owningFrame(name, act.frame.get())) {
    owner->vars[name] = std::move(value);
    return;
  }
  globals_[name] = std::move(value);
}

void Interpreter::deleteName(const std::string& name, Activation& act) {
  if (Frame* owner = owningFrame(name, act.frame.get())) {
    if (owner->vars.erase(name) == 0) {
      raise(builtinTypes().unboundLocalError, "local variable '" + name + "' referenced before assignment");
    }
    return;
  }
  if (globals_.erase(name) == 0) { raise(builtinTypes().nameError, "name '" + name + "' is not defined"); }
}

} // namespace pybox::rt
