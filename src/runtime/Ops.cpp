/***
 * Name: pybox::rt operations (types, truthiness, equality, hashing, ordering, membership)
 */
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>

#include "runtime/Callable.h"
#include "runtime/Heap.h"
#include "runtime/Native.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/detail/NestingGuard.h"

namespace pybox::rt {

using BO = ast::BinaryOperator;

Value newStr(std::string s) { return make<StrObj>(std::move(s)); }
Value newList(ValueList items) {
  Heap::checkLength(items.size());
  return make<ListObj>(std::move(items));
}
Value newTuple(ValueList items) {
  Heap::checkLength(items.size());
  return make<TupleObj>(std::move(items));
}
Value newDict() { return make<DictObj>(); }
Value newSet() { return make<SetObj>(); }

TypePtr typeOf(const Value& v) {
  const BuiltinTypes& t = builtinTypes();
  if (v.isNone()) { return t.noneType; }
  if (v.isBool()) { return t.boolType; }
  if (v.isInt()) { return t.intType; }
  if (v.isFloat()) { return t.floatType; }
  const Object* obj = v.object().get();
  switch (obj->kind) {
    case ObjKind::Str: return t.strType;
    case ObjKind::Bytes: return t.bytesType;
    case ObjKind::List: return t.listType;
    case ObjKind::Tuple: return t.tupleType;
    case ObjKind::Dict: return t.dictType;
    case ObjKind::Set: return t.setType;
    case ObjKind::Range: return t.rangeType;
    case ObjKind::Slice: return t.sliceType;
    case ObjKind::Iterator: return t.iteratorType;
    case ObjKind::Function: return t.functionType;
    case ObjKind::Builtin: return t.builtinFunctionType;
    case ObjKind::Coroutine: return t.coroutineType;
    case ObjKind::Type: return t.typeType;
    case ObjKind::Exception: return static_cast<const ExceptionObj*>(obj)->type;
    case ObjKind::Module: return t.moduleType;
    case ObjKind::Frame: return t.object;
    case ObjKind::Native: return static_cast<const NativeObject*>(obj)->type();
  }
  return t.object;
}

std::string typeName(const Value& v) {
  if (const auto* it = v.as<IteratorObj>()) { return it->typeName; }
  return typeOf(v)->name;
}

bool isInstance(const Value& v, const TypeObject* type) {
  const TypePtr t = typeOf(v);
  return t && t->isSubtypeOf(type);
}

bool truthy(const Value& v) {
  if (v.isNone()) { return false; }
  if (v.isBool()) { return v.asBool(); }
  if (v.isInt()) { return v.asInt() != 0; }
  if (v.isFloat()) { return v.asFloat() != 0.0; }
  const Object* obj = v.object().get();
  switch (obj->kind) {
    case ObjKind::Str: return !static_cast<const StrObj*>(obj)->value.empty();
    case ObjKind::Bytes: return !static_cast<const BytesObj*>(obj)->value.empty();
    case ObjKind::List: return !static_cast<const ListObj*>(obj)->items.empty();
    case ObjKind::Tuple: return !static_cast<const TupleObj*>(obj)->items.empty();
    case ObjKind::Dict: return !static_cast<const DictObj*>(obj)->table.empty();
    case ObjKind::Set: return !static_cast<const SetObj*>(obj)->table.empty();
    case ObjKind::Range: return static_cast<const RangeObj*>(obj)->length() > 0;
    case ObjKind::Native: return static_cast<const NativeObject*>(obj)->truthy();
    default: return true;
  }
}

namespace {

bool sequenceEquals(const ValueList& a, const ValueList& b) {
  if (a.size() != b.size()) { return false; }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!a[i].identical(b[i]) && !equals(a[i], b[i])) { return false; }
  }
  return true;
}

std::size_t combineHash(std::size_t seed, std::size_t h) {
  return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

const char* opSymbol(BO op) {
  switch (op) {
    case BO::Lt: return "<";
    case BO::Le: return "<=";
    case BO::Gt: return ">";
    case BO::Ge: return ">=";
    default: return "?";
  }
}

template <typename T>
bool applyOrder(BO op, const T& a, const T& b) {
  switch (op) {
    case BO::Lt: return a < b;
    case BO::Le: return a <= b;
    case BO::Gt: return a > b;
    case BO::Ge: return a >= b;
    default: return false;
  }
}

bool subsetOf(const ValueTable& a, const ValueTable& b) {
  if (a.size() > b.size()) { return false; }
  for (const Value& k : a.keys()) {
    if (!b.contains(k)) { return false; }
  }
  return true;
}

bool orderCompare(BO op, const Value& a, const Value& b) {
  if (a.isNumber() && b.isNumber()) {
    if (a.isIntegral() && b.isIntegral()) { return applyOrder(op, a.asInt(), b.asInt()); }
    return applyOrder(op, a.asFloat(), b.asFloat());
  }
  if (a.isObject() && b.isObject() && a.object()->kind == b.object()->kind) {
    const Object* x = a.object().get();
    const Object* y = b.object().get();
    switch (x->kind) {
      case ObjKind::Str:
        return applyOrder(op, static_cast<const StrObj*>(x)->value, static_cast<const StrObj*>(y)->value);
      case ObjKind::Bytes:
        return applyOrder(op, static_cast<const BytesObj*>(x)->value, static_cast<const BytesObj*>(y)->value);
      case ObjKind::List:
      case ObjKind::Tuple: {
        const ValueList& xs = x->kind == ObjKind::List ? static_cast<const ListObj*>(x)->items
                                                       : static_cast<const TupleObj*>(x)->items;
        const ValueList& ys = y->kind == ObjKind::List ? static_cast<const ListObj*>(y)->items
                                                       : static_cast<const TupleObj*>(y)->items;
        detail::NestingGuard guard("comparison");
        const std::size_t n = std::min(xs.size(), ys.size());
        for (std::size_t i = 0; i < n; ++i) {
          if (!xs[i].identical(ys[i]) && !equals(xs[i], ys[i])) { return orderCompare(op, xs[i], ys[i]); }
        }
        return applyOrder(op, xs.size(), ys.size());
      }
      case ObjKind::Set: {
        const ValueTable& xs = static_cast<const SetObj*>(x)->table;
        const ValueTable& ys = static_cast<const SetObj*>(y)->table;
        switch (op) {
          case BO::Lt: return xs.size() < ys.size() && subsetOf(xs, ys);
          case BO::Le: return subsetOf(xs, ys);
          case BO::Gt: return ys.size() < xs.size() && subsetOf(ys, xs);
          case BO::Ge: return subsetOf(ys, xs);
          default: return false;
        }
      }
      case ObjKind::Native: {
        const auto order = static_cast<const NativeObject*>(x)->compare(*static_cast<const NativeObject*>(y));
        if (order) { return applyOrder(op, *order, 0); }
        break;
      }
      default:
        break;
    }
  }
  raise(builtinTypes().typeError, std::string("'") + opSymbol(op) + "' not supported between instances of '" +
                                      typeName(a) + "' and '" + typeName(b) + "'");
}

} // namespace

bool equals(const Value& a, const Value& b) {
  if (a.isNumber() && b.isNumber()) {
    if (a.isIntegral() && b.isIntegral()) { return a.asInt() == b.asInt(); }
    return a.asFloat() == b.asFloat();
  }
  if (a.isNone() || b.isNone()) { return a.isNone() && b.isNone(); }
  if (!a.isObject() || !b.isObject()) { return false; }
  const Object* x = a.object().get();
  const Object* y = b.object().get();
  if (x == y) { return true; }
  if (x->kind != y->kind) { return false; }
  switch (x->kind) {
    case ObjKind::Str: return static_cast<const StrObj*>(x)->value == static_cast<const StrObj*>(y)->value;
    case ObjKind::Bytes: return static_cast<const BytesObj*>(x)->value == static_cast<const BytesObj*>(y)->value;
    case ObjKind::List: {
      detail::NestingGuard guard("comparison");
      return sequenceEquals(static_cast<const ListObj*>(x)->items, static_cast<const ListObj*>(y)->items);
    }
    case ObjKind::Tuple: {
      detail::NestingGuard guard("comparison");
      return sequenceEquals(static_cast<const TupleObj*>(x)->items, static_cast<const TupleObj*>(y)->items);
    }
    case ObjKind::Dict: {
      const ValueTable& xs = static_cast<const DictObj*>(x)->table;
      const ValueTable& ys = static_cast<const DictObj*>(y)->table;
      if (xs.size() != ys.size()) { return false; }
      detail::NestingGuard guard("comparison");
      for (const auto& e : xs.entries()) {
        const Value* other = ys.find(e.key);
        if (other == nullptr || (!other->identical(e.value) && !equals(e.value, *other))) { return false; }
      }
      return true;
    }
    case ObjKind::Set: {
      const ValueTable& xs = static_cast<const SetObj*>(x)->table;
      const ValueTable& ys = static_cast<const SetObj*>(y)->table;
      return xs.size() == ys.size() && subsetOf(xs, ys);
    }
    case ObjKind::Range: {
      const auto* r = static_cast<const RangeObj*>(x);
      const auto* s = static_cast<const RangeObj*>(y);
      const long long n = r->length();
      if (n != s->length()) { return false; }
      if (n == 0) { return true; }
      if (r->start != s->start) { return false; }
      return n == 1 || r->step == s->step;
    }
    case ObjKind::Native:
      return static_cast<const NativeObject*>(x)->equals(*static_cast<const NativeObject*>(y));
    default:
      return false;
  }
}

std::size_t hashValue(const Value& v) {
  if (v.isNone()) { return 0x345678U; }
  if (v.isIntegral()) { return std::hash<long long>{}(v.asInt()); }
  if (v.isFloat()) {
    const double d = v.asFloat();
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.2e18) {
      return std::hash<long long>{}(static_cast<long long>(d));
    }
    return std::hash<double>{}(d);
  }
  const Object* obj = v.object().get();
  switch (obj->kind) {
    case ObjKind::Str: return std::hash<std::string>{}(static_cast<const StrObj*>(obj)->value);
    case ObjKind::Bytes: return combineHash(0xb17e5U, std::hash<std::string>{}(static_cast<const BytesObj*>(obj)->value));
    case ObjKind::Tuple: {
      detail::NestingGuard guard("hash");
      std::size_t h = 0x7e57U;
      for (const Value& item : static_cast<const TupleObj*>(obj)->items) { h = combineHash(h, hashValue(item)); }
      return h;
    }
    case ObjKind::Range: {
      const auto* r = static_cast<const RangeObj*>(obj);
      return combineHash(combineHash(std::hash<long long>{}(r->length()), std::hash<long long>{}(r->start)),
                         std::hash<long long>{}(r->step));
    }
    case ObjKind::Native: return static_cast<const NativeObject*>(obj)->hash();
    case ObjKind::List:
    case ObjKind::Dict:
    case ObjKind::Set:
    case ObjKind::Slice:
      raise(builtinTypes().typeError, "unhashable type: '" + typeName(v) + "'");
    default:
      return std::hash<const void*>{}(obj);
  }
}

bool lessThan(const Value& a, const Value& b) { return orderCompare(BO::Lt, a, b); }

bool compareOp(BO op, const Value& a, const Value& b) {
  switch (op) {
    case BO::Eq: return a.identical(b) ? !(a.isFloat() && std::isnan(a.asFloat())) : equals(a, b);
    case BO::Ne: return !compareOp(BO::Eq, a, b);
    case BO::Lt:
    case BO::Le:
    case BO::Gt:
    case BO::Ge: return orderCompare(op, a, b);
    case BO::Is: return a.identical(b);
    case BO::IsNot: return !a.identical(b);
    case BO::In: return contains(b, a);
    case BO::NotIn: return !contains(b, a);
    default:
      raise(builtinTypes().typeError, "unsupported comparison");
  }
}

bool contains(const Value& container, const Value& item) {
  if (container.isObject()) {
    const Object* obj = container.object().get();
    switch (obj->kind) {
      case ObjKind::Str: {
        const auto* needle = item.as<StrObj>();
        if (needle == nullptr) {
          raise(builtinTypes().typeError, "'in <string>' requires string as left operand, not " + typeName(item));
        }
        return static_cast<const StrObj*>(obj)->value.find(needle->value) != std::string::npos;
      }
      case ObjKind::Bytes: {
        const std::string& hay = static_cast<const BytesObj*>(obj)->value;
        if (item.isIntegral()) {
          const long long b = item.asInt();
          if (b < 0 || b > 255) { raise(builtinTypes().valueError, "byte must be in range(0, 256)"); }
          return hay.find(static_cast<char>(b)) != std::string::npos;
        }
        if (const auto* needle = item.as<BytesObj>()) { return hay.find(needle->value) != std::string::npos; }
        raise(builtinTypes().typeError, "a bytes-like object is required, not '" + typeName(item) + "'");
      }
      case ObjKind::List:
      case ObjKind::Tuple: {
        const ValueList& items = obj->kind == ObjKind::List ? static_cast<const ListObj*>(obj)->items
                                                            : static_cast<const TupleObj*>(obj)->items;
        for (std::size_t i = 0; i < items.size(); ++i) {
          if (items[i].identical(item) || equals(items[i], item)) { return true; }
        }
        return false;
      }
      case ObjKind::Dict: return static_cast<const DictObj*>(obj)->table.contains(item);
      case ObjKind::Set: return static_cast<const SetObj*>(obj)->table.contains(item);
      case ObjKind::Range: {
        const auto* r = static_cast<const RangeObj*>(obj);
        long long n = 0;
        if (item.isIntegral()) {
          n = item.asInt();
        } else if (item.isFloat() && item.asFloat() == std::floor(item.asFloat()) && std::fabs(item.asFloat()) < 9.2e18) {
          n = static_cast<long long>(item.asFloat());
        } else {
          return false;
        }
        if (r->step > 0 ? (n < r->start || n >= r->stop) : (n > r->start || n <= r->stop)) { return false; }
        return (n - r->start) % r->step == 0;
      }
      case ObjKind::Type: {
        const auto* t = static_cast<const TypeObject*>(obj);
        if (!t->isEnum) { break; }
        for (const auto& [name, member] : t->members) {
          if (member.identical(item)) { return true; }
        }
        return false;
      }
      case ObjKind::Iterator: {
        while (auto next = iterNext(container)) {
          if (next->identical(item) || equals(*next, item)) { return true; }
        }
        return false;
      }
      default:
        break;
    }
  }
  raise(builtinTypes().typeError, "argument of type '" + typeName(container) + "' is not iterable");
}

} // namespace pybox::rt
