/***
 * Name: pybox::rt arithmetic
 * Purpose: Binary and unary operators over built-in values.
 * Theory of Operation:
 *   Integers are 64-bit; every int result is overflow checked with the
 *   compiler builtins and reported as OverflowError. Floor division and
 *   modulo follow Python's sign rules. Sequence repetition is checked
 *   against the heap's element cap before allocating.
 */
#include <climits>
#include <cstdint>
#include <cmath>
#include <string>
#include <utility>

#include "runtime/Builtins.h"
#include "runtime/Heap.h"
#include "runtime/Native.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"

namespace pybox::rt {

using BO = ast::BinaryOperator;
using UO = ast::UnaryOperator;

namespace {

[[noreturn]] void overflow() { raise(builtinTypes().overflowError, "integer overflow"); }

[[noreturn]] void unsupported(BO op, const Value& a, const Value& b) {
  raise(builtinTypes().typeError, std::string("unsupported operand type(s) for ") + ast::to_symbol(op) + ": '" +
                                      typeName(a) + "' and '" + typeName(b) + "'");
}

long long intPow(long long base, long long exp) {
  long long result = 1;
  while (exp > 0) {
    if ((exp & 1) != 0) { result = checkedMul(result, base); }
    exp >>= 1;
    if (exp > 0) { base = checkedMul(base, base); }
  }
  return result;
}

double floatPow(double a, double b) {
  if (a == 0.0 && b < 0.0) { raise(builtinTypes().zeroDivisionError, "0.0 cannot be raised to a negative power"); }
  if (a < 0.0 && b != std::floor(b)) {
    raise(builtinTypes().valueError, "negative number cannot be raised to a fractional power");
  }
  return std::pow(a, b);
}

Value numericOp(BO op, const Value& a, const Value& b) {
  const bool ints = a.isIntegral() && b.isIntegral();
  if (ints) {
    const long long x = a.asInt();
    const long long y = b.asInt();
    switch (op) {
      case BO::Add: return Value::integer(checkedAdd(x, y));
      case BO::Sub: return Value::integer(checkedSub(x, y));
      case BO::Mul: return Value::integer(checkedMul(x, y));
      case BO::Div:
        if (y == 0) { raise(builtinTypes().zeroDivisionError, "division by zero"); }
        return Value::real(static_cast<double>(x) / static_cast<double>(y));
      case BO::FloorDiv: return Value::integer(floorDiv(x, y));
      case BO::Mod: return Value::integer(floorMod(x, y));
      case BO::Pow:
        if (y < 0) { return Value::real(floatPow(static_cast<double>(x), static_cast<double>(y))); }
        return Value::integer(intPow(x, y));
      case BO::LShift:
        if (y < 0) { raise(builtinTypes().valueError, "negative shift count"); }
        if (x == 0) { return Value::integer(0); }
        if (y >= 63) { overflow(); }
        if (x > (LLONG_MAX >> y) || x < (LLONG_MIN >> y)) { overflow(); }
        return Value::integer(static_cast<long long>(static_cast<unsigned long long>(x) << y));
      case BO::RShift:
        if (y < 0) { raise(builtinTypes().valueError, "negative shift count"); }
        if (y >= 64) { return Value::integer(x < 0 ? -1 : 0); }
        return Value::integer(x >> y);
      case BO::BitAnd:
        if (a.isBool() && b.isBool()) { return Value::boolean(a.asBool() && b.asBool()); }
        return Value::integer(x & y);
      case BO::BitOr:
        if (a.isBool() && b.isBool()) { return Value::boolean(a.asBool() || b.asBool()); }
        return Value::integer(x | y);
      case BO::BitXor:
        if (a.isBool() && b.isBool()) { return Value::boolean(a.asBool() != b.asBool()); }
        return Value::integer(x ^ y);
      default: break;
    }
    unsupported(op, a, b);
  }
  const double x = a.asFloat();
  const double y = b.asFloat();
  switch (op) {
    case BO::Add: return Value::real(x + y);
    case BO::Sub: return Value::real(x - y);
    case BO::Mul: return Value::real(x * y);
    case BO::Div:
      if (y == 0.0) { raise(builtinTypes().zeroDivisionError, "float division by zero"); }
      return Value::real(x / y);
    case BO::FloorDiv:
      if (y == 0.0) { raise(builtinTypes().zeroDivisionError, "float floor division by zero"); }
      return Value::real(std::floor(x / y));
    case BO::Mod: {
      if (y == 0.0) { raise(builtinTypes().zeroDivisionError, "float modulo"); }
      double m = std::fmod(x, y);
      if (m != 0.0 && ((m < 0.0) != (y < 0.0))) { m += y; }
      return Value::real(m);
    }
    case BO::Pow: return Value::real(floatPow(x, y));
    default: break;
  }
  unsupported(op, a, b);
}

void checkRepeat(std::size_t size, long long times) {
  std::size_t total = 0;
  if (__builtin_mul_overflow(size, static_cast<std::size_t>(times), &total)) { total = SIZE_MAX; }
  Heap::checkLength(total);
}

Value repeat(const Value& seq, long long times) {
  if (times < 0) { times = 0; }
  if (const auto* s = seq.as<StrObj>()) {
    checkRepeat(s->value.size(), times);
    std::string out;
    out.reserve(s->value.size() * static_cast<std::size_t>(times));
    for (long long i = 0; i < times; ++i) { out += s->value; }
    return newStr(std::move(out));
  }
  if (const auto* b = seq.as<BytesObj>()) {
    checkRepeat(b->value.size(), times);
    std::string out;
    for (long long i = 0; i < times; ++i) { out += b->value; }
    return make<BytesObj>(std::move(out));
  }
  const bool isList = seq.as<ListObj>() != nullptr;
  const ValueList& items = isList ? seq.as<ListObj>()->items : seq.as<TupleObj>()->items;
  checkRepeat(items.size(), times);
  ValueList out;
  out.reserve(items.size() * static_cast<std::size_t>(times));
  for (long long i = 0; i < times; ++i) { out.insert(out.end(), items.begin(), items.end()); }
  return isList ? newList(std::move(out)) : newTuple(std::move(out));
}

bool isRepeatable(const Value& v) {
  return v.as<StrObj>() != nullptr || v.as<BytesObj>() != nullptr || v.as<ListObj>() != nullptr ||
         v.as<TupleObj>() != nullptr;
}

Value setOp(BO op, const ValueTable& x, const ValueTable& y) {
  auto out = make<SetObj>();
  switch (op) {
    case BO::BitOr:
      for (const Value& k : x.keys()) { out->table.insert(k, Value()); }
      for (const Value& k : y.keys()) { out->table.insert(k, Value()); }
      break;
    case BO::BitAnd:
      for (const Value& k : x.keys()) {
        if (y.contains(k)) { out->table.insert(k, Value()); }
      }
      break;
    case BO::Sub:
      for (const Value& k : x.keys()) {
        if (!y.contains(k)) { out->table.insert(k, Value()); }
      }
      break;
    case BO::BitXor:
      for (const Value& k : x.keys()) {
        if (!y.contains(k)) { out->table.insert(k, Value()); }
      }
      for (const Value& k : y.keys()) {
        if (!x.contains(k)) { out->table.insert(k, Value()); }
      }
      break;
    default: break;
  }
  return out;
}

bool isSetOp(BO op) { return op == BO::BitOr || op == BO::BitAnd || op == BO::Sub || op == BO::BitXor; }

} // namespace

long long checkedAdd(long long a, long long b) {
  long long r = 0;
  if (__builtin_add_overflow(a, b, &r)) { overflow(); }
  return r;
}

long long checkedSub(long long a, long long b) {
  long long r = 0;
  if (__builtin_sub_overflow(a, b, &r)) { overflow(); }
  return r;
}

long long checkedMul(long long a, long long b) {
  long long r = 0;
  if (__builtin_mul_overflow(a, b, &r)) { overflow(); }
  return r;
}

long long floorDiv(long long a, long long b) {
  if (b == 0) { raise(builtinTypes().zeroDivisionError, "integer division or modulo by zero"); }
  if (a == LLONG_MIN && b == -1) { overflow(); }
  long long q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) { --q; }
  return q;
}

long long floorMod(long long a, long long b) {
  if (b == 0) { raise(builtinTypes().zeroDivisionError, "integer division or modulo by zero"); }
  if (b == -1) { return 0; }
  long long m = a % b;
  if (m != 0 && ((m < 0) != (b < 0))) { m += b; }
  return m;
}

Value binaryOp(BO op, const Value& a, const Value& b) {
  if (a.isNumber() && b.isNumber()) { return numericOp(op, a, b); }

  if (const auto* n = a.as<NativeObject>()) {
    if (auto r = n->binaryOp(op, b, false)) { return *r; }
  }
  if (const auto* n = b.as<NativeObject>()) {
    if (auto r = n->binaryOp(op, a, true)) { return *r; }
  }

  switch (op) {
    case BO::Add: {
      if (const auto* x = a.as<StrObj>()) {
        if (const auto* y = b.as<StrObj>()) {
          Heap::checkLength(x->value.size() + y->value.size());
          return newStr(x->value + y->value);
        }
        raise(builtinTypes().typeError, "can only concatenate str (not \"" + typeName(b) + "\") to str");
      }
      if (const auto* x = a.as<BytesObj>()) {
        if (const auto* y = b.as<BytesObj>()) { return make<BytesObj>(x->value + y->value); }
      }
      if (const auto* x = a.as<ListObj>()) {
        if (const auto* y = b.as<ListObj>()) {
          ValueList out = x->items;
          out.insert(out.end(), y->items.begin(), y->items.end());
          return newList(std::move(out));
        }
        raise(builtinTypes().typeError, "can only concatenate list (not \"" + typeName(b) + "\") to list");
      }
      if (const auto* x = a.as<TupleObj>()) {
        if (const auto* y = b.as<TupleObj>()) {
          ValueList out = x->items;
          out.insert(out.end(), y->items.begin(), y->items.end());
          return newTuple(std::move(out));
        }
        raise(builtinTypes().typeError, "can only concatenate tuple (not \"" + typeName(b) + "\") to tuple");
      }
      break;
    }
    case BO::Mul:
      if (isRepeatable(a) && b.isIntegral()) { return repeat(a, b.asInt()); }
      if (isRepeatable(b) && a.isIntegral()) { return repeat(b, a.asInt()); }
      if (isRepeatable(a) || isRepeatable(b)) {
        raise(builtinTypes().typeError, "can't multiply sequence by non-int of type '" +
                                            typeName(isRepeatable(a) ? b : a) + "'");
      }
      break;
    case BO::Mod:
      if (const auto* x = a.as<StrObj>()) { return newStr(percentFormat(x->value, b)); }
      break;
    default:
      break;
  }

  if (isSetOp(op)) {
    const auto* xs = a.as<SetObj>();
    const auto* ys = b.as<SetObj>();
    if (xs != nullptr && ys != nullptr) { return setOp(op, xs->table, ys->table); }
    if (op == BO::BitOr) {
      const auto* xd = a.as<DictObj>();
      const auto* yd = b.as<DictObj>();
      if (xd != nullptr && yd != nullptr) {
        auto out = make<DictObj>();
        for (const auto& e : xd->table.entries()) { out->table.insert(e.key, e.value); }
        for (const auto& e : yd->table.entries()) { out->table.insert(e.key, e.value); }
        return out;
      }
    }
  }
  unsupported(op, a, b);
}

Value inplaceOp(BO op, const Value& a, const Value& b) {
  if (auto* list = a.as<ListObj>()) {
    if (op == BO::Add) {
      ValueList extra;
      const Value it = getIter(b);
      while (auto next = iterNext(it)) { extra.push_back(std::move(*next)); }
      Heap::checkLength(list->items.size() + extra.size());
      list->items.insert(list->items.end(), extra.begin(), extra.end());
      return a;
    }
    if (op == BO::Mul && b.isIntegral()) {
      const Value repeated = repeat(a, b.asInt());
      list->items = repeated.as<ListObj>()->items;
      return a;
    }
  }
  if (auto* set = a.as<SetObj>()) {
    if (const auto* other = b.as<SetObj>(); other != nullptr && isSetOp(op)) {
      const Value result = setOp(op, set->table, other->table);
      set->table = result.as<SetObj>()->table;
      return a;
    }
  }
  if (auto* dict = a.as<DictObj>()) {
    if (const auto* other = b.as<DictObj>(); other != nullptr && op == BO::BitOr) {
      for (const auto& e : other->table.entries()) { dict->table.insert(e.key, e.value); }
      return a;
    }
  }
  return binaryOp(op, a, b);
}

Value unaryOp(UO op, const Value& v) {
  switch (op) {
    case UO::Not: return Value::boolean(!truthy(v));
    case UO::Neg:
      if (v.isIntegral()) {
        if (v.asInt() == LLONG_MIN) { overflow(); }
        return Value::integer(-v.asInt());
      }
      if (v.isFloat()) { return Value::real(-v.asFloat()); }
      raise(builtinTypes().typeError, "bad operand type for unary -: '" + typeName(v) + "'");
    case UO::Pos:
      if (v.isIntegral()) { return Value::integer(v.asInt()); }
      if (v.isFloat()) { return v; }
      raise(builtinTypes().typeError, "bad operand type for unary +: '" + typeName(v) + "'");
    case UO::Invert:
      if (v.isIntegral()) { return Value::integer(~v.asInt()); }
      raise(builtinTypes().typeError, "bad operand type for unary ~: '" + typeName(v) + "'");
  }
  raise(builtinTypes().typeError, "bad unary operator");
}

} // namespace pybox::rt
