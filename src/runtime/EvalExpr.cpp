/***
 * Name: pybox::rt::Interpreter (expressions)
 * Purpose: Evaluate expression nodes to values.
 * Theory of Operation:
 *   Comprehensions get a fresh frame whose scope holds the loop targets; the
 *   first iterable is evaluated in the enclosing scope, as Python does.
 *   Generator expressions are evaluated eagerly and handed out as an
 *   iterator over the results.
 */
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "runtime/Builtins.h"
#include "runtime/Interpreter.h"
#include "runtime/Native.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"

namespace pybox::rt {

namespace {

class EllipsisObj final : public NativeObject {
 public:
  TypePtr type() const override {
    static const TypePtr t = std::make_shared<TypeObject>("ellipsis", builtinTypes().object);
    return t;
  }
  std::string repr() const override { return "Ellipsis"; }
};

Value ellipsis() {
  static const Value v = Value(std::make_shared<EllipsisObj>());
  return v;
}

[[noreturn]] void unsupported(const std::string& what) { raise(builtinTypes().notImplementedError, what); }

const std::vector<ast::ComprehensionFor>& forsOf(const ast::Expr& e) {
  switch (e.kind) {
    case ast::NodeKind::ListComp: return static_cast<const ast::ListComp&>(e).fors;
    case ast::NodeKind::SetComp: return static_cast<const ast::SetComp&>(e).fors;
    case ast::NodeKind::DictComp: return static_cast<const ast::DictComp&>(e).fors;
    default: return static_cast<const ast::GeneratorExpr&>(e).fors;
  }
}

} // namespace

Value Interpreter::eval(const ast::Expr& expr, Activation& act) {
  switch (expr.kind) {
    case ast::NodeKind::IntLiteral: return Value::integer(static_cast<const ast::IntLiteral&>(expr).value);
    case ast::NodeKind::FloatLiteral: return Value::real(static_cast<const ast::FloatLiteral&>(expr).value);
    case ast::NodeKind::ImagLiteral: unsupported("complex numbers are not supported");
    case ast::NodeKind::StringLiteral: return newStr(static_cast<const ast::StringLiteral&>(expr).value);
    case ast::NodeKind::BytesLiteral: return make<BytesObj>(static_cast<const ast::BytesLiteral&>(expr).value);
    case ast::NodeKind::BoolLiteral: return Value::boolean(static_cast<const ast::BoolLiteral&>(expr).value);
    case ast::NodeKind::NoneLiteral: return Value();
    case ast::NodeKind::EllipsisLiteral: return ellipsis();
    case ast::NodeKind::FStringLiteral: return evalFString(static_cast<const ast::FStringLiteral&>(expr), act);
    case ast::NodeKind::Name: return loadName(static_cast<const ast::Name&>(expr).id, act);
    case ast::NodeKind::Attribute: {
      const auto& attr = static_cast<const ast::Attribute&>(expr);
      return getAttr(eval(*attr.value, act), attr.attr);
    }
    case ast::NodeKind::Subscript: {
      const auto& sub = static_cast<const ast::Subscript&>(expr);
      const Value container = eval(*sub.value, act);
      return getItem(container, evalSubscriptIndex(*sub.slice, act));
    }
    case ast::NodeKind::Slice: return evalSubscriptIndex(expr, act);
    case ast::NodeKind::Call: return evalCall(static_cast<const ast::Call&>(expr), act);
    case ast::NodeKind::BinaryExpr: return evalBinary(static_cast<const ast::Binary&>(expr), act);
    case ast::NodeKind::UnaryExpr: {
      const auto& u = static_cast<const ast::Unary&>(expr);
      const Value operand = eval(*u.operand, act);
      if (u.op == ast::UnaryOperator::Not) { return Value::boolean(!truthy(operand)); }
      return unaryOp(u.op, operand);
    }
    case ast::NodeKind::Compare: return evalCompare(static_cast<const ast::Compare&>(expr), act);
    case ast::NodeKind::IfExpr: {
      const auto& e = static_cast<const ast::IfExpr&>(expr);
      return truthy(eval(*e.test, act)) ? eval(*e.body, act) : eval(*e.orelse, act);
    }
    case ast::NodeKind::LambdaExpr: return evalLambda(static_cast<const ast::LambdaExpr&>(expr), act);
    case ast::NodeKind::NamedExpr: {
      const auto& e = static_cast<const ast::NamedExpr&>(expr);
      Value value = eval(*e.value, act);
      storeName(static_cast<const ast::Name&>(*e.target).id, value, act);
      return value;
    }
    case ast::NodeKind::Starred: raise(builtinTypes().runtimeError, "can't use starred expression here");
    case ast::NodeKind::TupleLiteral:
      return newTuple(evalElements(static_cast<const ast::TupleLiteral&>(expr).elements, act));
    case ast::NodeKind::ListLiteral:
      return newList(evalElements(static_cast<const ast::ListLiteral&>(expr).elements, act));
    case ast::NodeKind::SetLiteral: {
      Value set = newSet();
      auto& table = set.as<SetObj>()->table;
      for (auto& item : evalElements(static_cast<const ast::SetLiteral&>(expr).elements, act)) {
        table.insert(item, Value());
      }
      return set;
    }
    case ast::NodeKind::DictLiteral: {
      const auto& d = static_cast<const ast::DictLiteral&>(expr);
      Value dict = newDict();
      auto& table = dict.as<DictObj>()->table;
      for (std::size_t i = 0; i < d.keys.size(); ++i) {
        if (!d.keys[i]) {
          const Value mapping = eval(*d.values[i], act);
          const auto* source = mapping.as<DictObj>();
          if (source == nullptr) { raise(builtinTypes().typeError, "'" + typeName(mapping) + "' object is not a mapping"); }
          for (const auto& e : source->table.entries()) { table.insert(e.key, e.value); }
          continue;
        }
        Value key = eval(*d.keys[i], act);
        table.insert(key, eval(*d.values[i], act));
      }
      return dict;
    }
    case ast::NodeKind::ListComp:
    case ast::NodeKind::SetComp:
    case ast::NodeKind::DictComp:
    case ast::NodeKind::GeneratorExpr: return evalComprehension(expr, act);
    case ast::NodeKind::AwaitExpr: return await(eval(*static_cast<const ast::AwaitExpr&>(expr).value, act));
    case ast::NodeKind::YieldExpr: unsupported("generators ('yield') are not supported");
    default: unsupported(std::string("unsupported expression: ") + ast::to_string(expr.kind));
  }
}

Value Interpreter::evalBinary(const ast::Binary& e, Activation& act) {
  Value lhs = eval(*e.lhs, act);
  if (e.op == ast::BinaryOperator::And) { return truthy(lhs) ? eval(*e.rhs, act) : lhs; }
  if (e.op == ast::BinaryOperator::Or) { return truthy(lhs) ? lhs : eval(*e.rhs, act); }
  const Value rhs = eval(*e.rhs, act);
  return binaryOp(e.op, lhs, rhs);
}

Value Interpreter::evalCompare(const ast::Compare& e, Activation& act) {
  Value left = eval(*e.left, act);
  for (std::size_t i = 0; i < e.ops.size(); ++i) {
    Value right = eval(*e.comparators[i], act);
    if (!compareOp(e.ops[i], left, right)) { return Value::boolean(false); }
    left = std::move(right);
  }
  return Value::boolean(true);
}

ValueList Interpreter::evalElements(const std::vector<std::unique_ptr<ast::Expr>>& elements, Activation& act) {
  ValueList out;
  out.reserve(elements.size());
  for (const auto& element : elements) {
    if (element->kind == ast::NodeKind::Starred) {
      for (auto& v : materialize(eval(*static_cast<const ast::Starred&>(*element).value, act))) {
        Heap::checkLength(out.size() + 1);
        out.push_back(std::move(v));
      }
      continue;
    }
    out.push_back(eval(*element, act));
  }
  return out;
}

Value Interpreter::evalCall(const ast::Call& e, Activation& act) {
  const Value callee = eval(*e.callee, act);
  CallArgs args;
  args.positional = evalElements(e.args, act);
  for (const auto& kw : e.keywords) {
    if (!kw.name.empty()) {
      args.keywords.emplace_back(kw.name, eval(*kw.value, act));
      continue;
    }
    const Value mapping = eval(*kw.value, act);
    const auto* dict = mapping.as<DictObj>();
    if (dict == nullptr) {
      raise(builtinTypes().typeError, "argument after ** must be a mapping, not " + typeName(mapping));
    }
    for (const auto& entry : dict->table.entries()) {
      const auto* key = entry.key.as<StrObj>();
      if (key == nullptr) { raise(builtinTypes().typeError, "keywords must be strings"); }
      args.keywords.emplace_back(key->value, entry.value);
    }
  }
  return call(callee, std::move(args));
}

Value Interpreter::evalSubscriptIndex(const ast::Expr& slice, Activation& act) {
  if (slice.kind == ast::NodeKind::Slice) {
    const auto& s = static_cast<const ast::Slice&>(slice);
    Value lower = s.lower ? eval(*s.lower, act) : Value();
    Value upper = s.upper ? eval(*s.upper, act) : Value();
    Value step = s.step ? eval(*s.step, act) : Value();
    return make<SliceObj>(std::move(lower), std::move(upper), std::move(step));
  }
  if (slice.kind == ast::NodeKind::TupleLiteral) {
    ValueList parts;
    for (const auto& element : static_cast<const ast::TupleLiteral&>(slice).elements) {
      parts.push_back(evalSubscriptIndex(*element, act));
    }
    return newTuple(std::move(parts));
  }
  return eval(slice, act);
}

void Interpreter::runFors(const std::vector<ast::ComprehensionFor>& fors, std::size_t index, const Value& iterable,
                          Activation& act, const std::function<void()>& emit) {
  const ast::ComprehensionFor& clause = fors[index];
  iterate(iterable, [&](const Value& item) {
    assign(*clause.target, item, act);
    for (const auto& cond : clause.ifs) {
      if (!truthy(eval(*cond, act))) { return true; }
    }
    if (index + 1 == fors.size()) {
      emit();
    } else {
      runFors(fors, index + 1, eval(*fors[index + 1].iter, act), act, emit);
    }
    return true;
  });
}

Value Interpreter::evalComprehension(const ast::Expr& e, Activation& act) {
  const auto& fors = forsOf(e);
  for (const auto& clause : fors) {
    if (clause.isAsync) { unsupported("asynchronous comprehensions are not supported"); }
  }
  const Value first = eval(*fors.front().iter, act);
  Activation inner{make<Frame>(scopeFor(e), act.frame), Value()};

  switch (e.kind) {
    case ast::NodeKind::SetComp: {
      const auto& comp = static_cast<const ast::SetComp&>(e);
      Value set = newSet();
      auto& table = set.as<SetObj>()->table;
      runFors(fors, 0, first, inner, [&] {
        Heap::checkLength(table.size() + 1);
        table.insert(eval(*comp.elt, inner), Value());
      });
      return set;
    }
    case ast::NodeKind::DictComp: {
      const auto& comp = static_cast<const ast::DictComp&>(e);
      Value dict = newDict();
      auto& table = dict.as<DictObj>()->table;
      runFors(fors, 0, first, inner, [&] {
        Heap::checkLength(table.size() + 1);
        Value key = eval(*comp.key, inner);
        table.insert(key, eval(*comp.value, inner));
      });
      return dict;
    }
    default: {
      const ast::Expr& elt = e.kind == ast::NodeKind::ListComp ? *static_cast<const ast::ListComp&>(e).elt
                                                                : *static_cast<const ast::GeneratorExpr&>(e).elt;
      ValueList items;
      runFors(fors, 0, first, inner, [&] {
        Heap::checkLength(items.size() + 1);
        items.push_back(eval(elt, inner));
      });
      if (e.kind == ast::NodeKind::ListComp) { return newList(std::move(items)); }
      return make<IteratorObj>("generator", [items = std::move(items), pos = std::size_t{0}]() mutable {
        if (pos >= items.size()) { return std::optional<Value>(); }
        return std::optional<Value>(items[pos++]);
      });
    }
  }
}

Value Interpreter::evalFString(const ast::FStringLiteral& f, Activation& act) {
  std::string out;
  for (const auto& part : f.parts) {
    if (!part.isExpr) {
      out += part.text;
      continue;
    }
    Value v = eval(*part.expr, act);
    if (part.conversion == 'r' || part.conversion == 'a') {
      v = newStr(repr(v));
    } else if (part.conversion == 's') {
      v = newStr(str(v));
    }
    std::string spec;
    if (part.formatSpec) { spec = str(evalFString(*part.formatSpec, act)); }
    out += formatWithSpec(*this, v, spec);
  }
  return newStr(std::move(out));
}

Value Interpreter::evalLambda(const ast::LambdaExpr& e, Activation& act) {
  auto fn = makeFunction(e, e.params, act);
  fn->name = "<lambda>";
  fn->lambda = &e;
  return fn;
}

} // namespace pybox::rt
