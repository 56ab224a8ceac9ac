/***
 * Name: pybox::rt builtin functions
 * Purpose: The native functions a fragment namespace exposes (print, len, sorted, ...).
 * Theory of Operation:
 *   Each builtin is a NativeFn reading its arguments through ArgReader.
 *   enumerate, zip, map and filter are lazy iterators that hold the
 *   interpreter by pointer; they never outlive the execution that made them.
 *   print appends to the interpreter's captured console, never to stdout.
 */
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "runtime/Builtins.h"
#include "runtime/Callable.h"
#include "runtime/Interpreter.h"
#include "runtime/Native.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/Text.h"
#include "runtime/detail/ArgReader.h"

namespace pybox::rt {

using detail::ArgReader;

namespace {

const BuiltinTypes& types() { return builtinTypes(); }

Value fn(const std::string& name, NativeFn f) { return make<BuiltinFunction>(name, std::move(f)); }

Value builtinPrint(Interpreter& interp, CallArgs& args) {
  ArgReader r("print", args);
  std::string sep = " ";
  std::string end = "\n";
  if (auto v = r.keyword("sep"); v && !v->isNone()) { sep = detail::toString(*v, "print"); }
  if (auto v = r.keyword("end"); v && !v->isNone()) { end = detail::toString(*v, "print"); }
  (void)r.keyword("flush");
  if (r.keyword("file")) { raise(types().typeError, "print() does not support the 'file' argument"); }
  r.finish();
  std::string line;
  for (std::size_t i = 0; i < r.count(); ++i) {
    if (i != 0) { line += sep; }
    line += str(r.at(i));
  }
  line += end;
  std::string& console = interp.console();
  if (console.size() + line.size() > interp.limits().maxSequenceLength) {
    raise(types().memoryError, "captured output limit exceeded");
  }
  console += line;
  return Value();
}

Value builtinLen(Interpreter&, CallArgs& args) {
  ArgReader r("len", args);
  r.noKeywords();
  r.expect(1, 1);
  return Value::integer(length(r.at(0)));
}

Value builtinEnumerate(Interpreter&, CallArgs& args) {
  ArgReader r("enumerate", args);
  auto iterable = r.argument(0, "iterable");
  auto start = r.argument(1, "start");
  r.finish();
  if (!iterable) { raise(types().typeError, "enumerate() missing required argument 'iterable'"); }
  Value it = getIter(*iterable);
  long long index = start ? detail::toInteger(*start) : 0;
  return make<IteratorObj>("enumerate", [it, index]() mutable -> std::optional<Value> {
    auto next = iterNext(it);
    if (!next) { return std::nullopt; }
    Value pair = newTuple({Value::integer(index), *next});
    index = checkedAdd(index, 1);
    return pair;
  });
}

Value builtinZip(Interpreter&, CallArgs& args) {
  ArgReader r("zip", args);
  (void)r.keyword("strict");
  r.finish();
  ValueList iterators;
  for (const auto& v : r.positional()) { iterators.push_back(getIter(v)); }
  return make<IteratorObj>("zip", [iterators]() -> std::optional<Value> {
    if (iterators.empty()) { return std::nullopt; }
    ValueList row;
    for (const auto& it : iterators) {
      auto next = iterNext(it);
      if (!next) { return std::nullopt; }
      row.push_back(std::move(*next));
    }
    return newTuple(std::move(row));
  });
}

Value builtinMap(Interpreter& interp, CallArgs& args) {
  ArgReader r("map", args);
  r.noKeywords();
  if (r.count() < 2) { raise(types().typeError, "map() must have at least two arguments."); }
  Value func = r.at(0);
  ValueList iterators;
  for (std::size_t i = 1; i < r.count(); ++i) { iterators.push_back(getIter(r.at(i))); }
  Interpreter* ip = &interp;
  return make<IteratorObj>("map", [ip, func, iterators]() -> std::optional<Value> {
    CallArgs call;
    for (const auto& it : iterators) {
      auto next = iterNext(it);
      if (!next) { return std::nullopt; }
      call.positional.push_back(std::move(*next));
    }
    return ip->call(func, std::move(call));
  });
}

Value builtinFilter(Interpreter& interp, CallArgs& args) {
  ArgReader r("filter", args);
  r.noKeywords();
  r.expect(2, 2);
  Value func = r.at(0);
  Value it = getIter(r.at(1));
  Interpreter* ip = &interp;
  return make<IteratorObj>("filter", [ip, func, it]() -> std::optional<Value> {
    for (;;) {
      ip->poll();
      auto next = iterNext(it);
      if (!next) { return std::nullopt; }
      bool keep = false;
      if (func.isNone()) {
        keep = truthy(*next);
      } else {
        CallArgs call;
        call.positional.push_back(*next);
        keep = truthy(ip->call(func, std::move(call)));
      }
      if (keep) { return next; }
    }
  });
}

Value builtinSorted(Interpreter& interp, CallArgs& args) {
  ArgReader r("sorted", args);
  r.expect(1, 1);
  Value key = r.keyword("key").value_or(Value());
  const bool reverse = truthy(r.keyword("reverse").value_or(Value::boolean(false)));
  r.finish();
  ValueList items = interp.materialize(r.at(0));
  detail::sortValues(interp, items, key, reverse);
  return newList(std::move(items));
}

Value builtinReversed(Interpreter&, CallArgs& args) {
  ArgReader r("reversed", args);
  r.noKeywords();
  r.expect(1, 1);
  const Value& seq = r.at(0);
  ValueList items;
  if (const auto* list = seq.as<ListObj>()) {
    items = list->items;
  } else if (const auto* tuple = seq.as<TupleObj>()) {
    items = tuple->items;
  } else if (const auto* range = seq.as<RangeObj>()) {
    Heap::checkLength(static_cast<std::size_t>(range->length()));
    for (long long i = 0; i < range->length(); ++i) { items.push_back(Value::integer(range->at(i))); }
  } else if (const auto* s = seq.as<StrObj>()) {
    for (char32_t c : text::decode(s->value)) { items.push_back(newStr(text::encode(c))); }
  } else {
    raise(types().typeError, "'" + typeName(seq) + "' object is not reversible");
  }
  std::reverse(items.begin(), items.end());
  return make<IteratorObj>("reversed", [items = std::move(items), pos = std::size_t{0}]() mutable {
    if (pos >= items.size()) { return std::optional<Value>(); }
    return std::optional<Value>(items[pos++]);
  });
}

Value builtinAbs(Interpreter&, CallArgs& args) {
  ArgReader r("abs", args);
  r.noKeywords();
  r.expect(1, 1);
  const Value& v = r.at(0);
  if (v.isFloat()) { return Value::real(std::fabs(v.asFloat())); }
  if (v.isIntegral()) {
    const long long i = v.asInt();
    if (i == std::numeric_limits<long long>::min()) { raise(types().overflowError, "integer overflow"); }
    return Value::integer(i < 0 ? -i : i);
  }
  raise(types().typeError, "bad operand type for abs(): '" + typeName(v) + "'");
}

Value minMax(Interpreter& interp, CallArgs& args, bool wantMax) {
  const char* name = wantMax ? "max" : "min";
  ArgReader r(name, args);
  Value key = r.keyword("key").value_or(Value());
  auto fallback = r.keyword("default");
  r.finish();
  if (r.count() == 0) { raise(types().typeError, std::string(name) + " expected at least 1 argument, got 0"); }
  if (r.count() > 1 && fallback) {
    raise(types().typeError,
          std::string("Cannot specify a default for ") + name + "() with multiple positional arguments");
  }
  ValueList items = r.count() == 1 ? interp.materialize(r.at(0)) : r.positional();
  if (items.empty()) {
    if (fallback) { return *fallback; }
    raise(types().valueError, std::string(name) + "() arg is an empty sequence");
  }
  auto keyOf = [&](const Value& v) {
    if (key.isNone()) { return v; }
    CallArgs call;
    call.positional.push_back(v);
    return interp.call(key, std::move(call));
  };
  Value best = items[0];
  Value bestKey = keyOf(best);
  for (std::size_t i = 1; i < items.size(); ++i) {
    Value k = keyOf(items[i]);
    if (wantMax ? lessThan(bestKey, k) : lessThan(k, bestKey)) {
      best = items[i];
      bestKey = std::move(k);
    }
  }
  return best;
}

Value builtinSum(Interpreter& interp, CallArgs& args) {
  ArgReader r("sum", args);
  r.expect(1, 2);
  auto start = r.argument(1, "start");
  r.finish();
  Value acc = start.value_or(Value::integer(0));
  if (acc.as<StrObj>() != nullptr) { raise(types().typeError, "sum() can't sum strings [use ''.join(seq) instead]"); }
  interp.iterate(r.at(0), [&](const Value& v) {
    acc = binaryOp(ast::BinaryOperator::Add, acc, v);
    return true;
  });
  return acc;
}

Value builtinAny(Interpreter& interp, CallArgs& args, bool all) {
  ArgReader r(all ? "all" : "any", args);
  r.noKeywords();
  r.expect(1, 1);
  bool result = all;
  interp.iterate(r.at(0), [&](const Value& v) {
    if (truthy(v) != all) {
      result = !all;
      return false;
    }
    return true;
  });
  return Value::boolean(result);
}

long long floatToInt(double d) {
  if (std::isnan(d)) { raise(types().valueError, "cannot convert float NaN to integer"); }
  if (std::isinf(d)) { raise(types().overflowError, "cannot convert float infinity to integer"); }
  if (d >= 9223372036854775808.0 || d < -9223372036854775808.0) {
    raise(types().overflowError, "int too large to convert");
  }
  return static_cast<long long>(d);
}

Value builtinRound(Interpreter&, CallArgs& args) {
  ArgReader r("round", args);
  auto number = r.argument(0, "number");
  auto digits = r.argument(1, "ndigits");
  r.finish();
  if (!number) { raise(types().typeError, "round() missing required argument 'number' (pos 1)"); }
  const Value& x = *number;
  const bool noDigits = !digits || digits->isNone();
  if (x.isIntegral()) {
    if (noDigits) { return Value::integer(x.asInt()); }
    const long long nd = detail::toInteger(*digits);
    if (nd >= 0) { return Value::integer(x.asInt()); }
    if (nd < -18) { return Value::integer(0); }
    long long m = 1;
    for (long long i = 0; i < -nd; ++i) { m *= 10; }
    long long q = floorDiv(x.asInt(), m);
    const long long rem = x.asInt() - q * m;
    if (2 * rem > m || (2 * rem == m && (q % 2) != 0)) { ++q; }
    return Value::integer(checkedMul(q, m));
  }
  if (!x.isFloat()) { raise(types().typeError, "type " + typeName(x) + " doesn't define __round__ method"); }
  const double d = x.asFloat();
  if (noDigits) { return Value::integer(floatToInt(std::nearbyint(d))); }
  const long long nd = detail::toInteger(*digits);
  if (!std::isfinite(d) || nd > 308) { return Value::real(d); }
  if (nd >= 0) {
    char buf[512];
    std::snprintf(buf, sizeof buf, "%.*f", static_cast<int>(nd), d);
    return Value::real(std::strtod(buf, nullptr));
  }
  if (nd < -308) { return Value::real(0.0 * d); }
  const double scale = std::pow(10.0, static_cast<double>(-nd));
  return Value::real(std::nearbyint(d / scale) * scale);
}

Value builtinIsinstance(Interpreter&, CallArgs& args) {
  ArgReader r("isinstance", args);
  r.noKeywords();
  r.expect(2, 2);
  const Value& spec = r.at(1);
  auto check = [&](const Value& candidate) {
    const auto* type = candidate.as<TypeObject>();
    if (type == nullptr) { raise(types().typeError, "isinstance() arg 2 must be a type or tuple of types"); }
    return isInstance(r.at(0), type);
  };
  if (const auto* tuple = spec.as<TupleObj>()) {
    for (const auto& item : tuple->items) {
      if (check(item)) { return Value::boolean(true); }
    }
    return Value::boolean(false);
  }
  return Value::boolean(check(spec));
}

Value builtinHasattr(Interpreter& interp, CallArgs& args) {
  ArgReader r("hasattr", args);
  r.noKeywords();
  r.expect(2, 2);
  const std::string& name = detail::toString(r.at(1), "hasattr");
  return Value::boolean(interp.findAttr(r.at(0), name).has_value());
}

Value builtinGetattr(Interpreter& interp, CallArgs& args) {
  ArgReader r("getattr", args);
  r.noKeywords();
  r.expect(2, 3);
  const std::string& name = detail::toString(r.at(1), "getattr");
  if (r.count() == 3) { return interp.findAttr(r.at(0), name).value_or(r.at(2)); }
  return interp.getAttr(r.at(0), name);
}

Value builtinRepr(Interpreter&, CallArgs& args) {
  ArgReader r("repr", args);
  r.noKeywords();
  r.expect(1, 1);
  return newStr(repr(r.at(0)));
}

Value builtinCallable(Interpreter&, CallArgs& args) {
  ArgReader r("callable", args);
  r.noKeywords();
  r.expect(1, 1);
  const Value& v = r.at(0);
  return Value::boolean(v.as<FunctionObj>() != nullptr || v.as<BuiltinFunction>() != nullptr ||
                        v.as<TypeObject>() != nullptr);
}

Value builtinIter(Interpreter&, CallArgs& args) {
  ArgReader r("iter", args);
  r.noKeywords();
  r.expect(1, 1);
  return getIter(r.at(0));
}

Value builtinNext(Interpreter&, CallArgs& args) {
  ArgReader r("next", args);
  r.noKeywords();
  r.expect(1, 2);
  if (auto v = iterNext(r.at(0))) { return *v; }
  if (r.count() == 2) { return r.at(1); }
  throw ScriptError(make<ExceptionObj>(types().stopIteration, ValueList{}));
}

// a * b mod m without overflow for any 64-bit modulus.
unsigned long long mulMod(unsigned long long a, unsigned long long b, unsigned long long m) {
  unsigned long long result = 0;
  a %= m;
  while (b > 0) {
    if ((b & 1) != 0) { result = (result >= m - a) ? result - (m - a) : result + a; }
    a = (a >= m - a) ? a - (m - a) : a + a;
    b >>= 1;
  }
  return result;
}

Value builtinPow(Interpreter&, CallArgs& args) {
  ArgReader r("pow", args);
  auto base = r.argument(0, "base");
  auto exp = r.argument(1, "exp");
  auto mod = r.argument(2, "mod");
  r.finish();
  if (!base || !exp) { raise(types().typeError, "pow() missing required argument"); }
  if (!mod || mod->isNone()) { return binaryOp(ast::BinaryOperator::Pow, *base, *exp); }
  if (!base->isIntegral() || !exp->isIntegral() || !mod->isIntegral()) {
    raise(types().typeError, "pow() 3rd argument not allowed unless all arguments are integers");
  }
  long long m = mod->asInt();
  long long e = exp->asInt();
  if (m == 0) { raise(types().valueError, "pow() 3rd argument cannot be 0"); }
  if (e < 0) { raise(types().valueError, "pow() negative exponent is not supported with a modulus"); }
  const bool negative = m < 0;
  if (negative) { m = -m; }
  const auto um = static_cast<unsigned long long>(m);
  unsigned long long result = 1 % um;
  unsigned long long b = static_cast<unsigned long long>(floorMod(base->asInt(), m));
  while (e > 0) {
    if ((e & 1) != 0) { result = mulMod(result, b, um); }
    b = mulMod(b, b, um);
    e >>= 1;
  }
  long long out = static_cast<long long>(result);
  if (negative && out != 0) { out -= m; }
  return Value::integer(out);
}

Value builtinDivmod(Interpreter&, CallArgs& args) {
  ArgReader r("divmod", args);
  r.noKeywords();
  r.expect(2, 2);
  return newTuple({binaryOp(ast::BinaryOperator::FloorDiv, r.at(0), r.at(1)),
                   binaryOp(ast::BinaryOperator::Mod, r.at(0), r.at(1))});
}

Value builtinOrd(Interpreter&, CallArgs& args) {
  ArgReader r("ord", args);
  r.noKeywords();
  r.expect(1, 1);
  const Value& v = r.at(0);
  if (const auto* s = v.as<StrObj>()) {
    const std::u32string cps = text::decode(s->value);
    if (cps.size() != 1) {
      raise(types().typeError,
            "ord() expected a character, but string of length " + std::to_string(cps.size()) + " found");
    }
    return Value::integer(static_cast<long long>(cps[0]));
  }
  if (const auto* b = v.as<BytesObj>()) {
    if (b->value.size() != 1) {
      raise(types().typeError,
            "ord() expected a character, but string of length " + std::to_string(b->value.size()) + " found");
    }
    return Value::integer(static_cast<unsigned char>(b->value[0]));
  }
  raise(types().typeError, "ord() expected string of length 1, but " + typeName(v) + " found");
}

Value builtinChr(Interpreter&, CallArgs& args) {
  ArgReader r("chr", args);
  r.noKeywords();
  r.expect(1, 1);
  const long long cp = r.integer(0);
  if (cp < 0 || cp > 0x10FFFF) { raise(types().valueError, "chr() arg not in range(0x110000)"); }
  return newStr(text::encode(static_cast<char32_t>(cp)));
}

Value radix(CallArgs& args, const char* name, int base, const char* prefix) {
  ArgReader r(name, args);
  r.noKeywords();
  r.expect(1, 1);
  const long long v = r.integer(0);
  unsigned long long magnitude = v < 0 ? 0ULL - static_cast<unsigned long long>(v) : static_cast<unsigned long long>(v);
  std::string digits;
  do {
    digits += "0123456789abcdef"[magnitude % static_cast<unsigned>(base)];
    magnitude /= static_cast<unsigned>(base);
  } while (magnitude != 0);
  std::reverse(digits.begin(), digits.end());
  return newStr(std::string(v < 0 ? "-" : "") + prefix + digits);
}

Value builtinDir(Interpreter& interp, CallArgs& args) {
  ArgReader r("dir", args);
  r.noKeywords();
  r.expect(0, 1);
  std::vector<std::string> names;
  if (r.count() == 0) {
    names = interp.globalNames();
  } else {
    const Value& v = r.at(0);
    if (const auto* native = v.as<NativeObject>()) {
      names = native->attrNames();
    } else if (const auto* module = v.as<ModuleObj>()) {
      for (const auto& [k, value] : module->attrs) { names.push_back(k); }
    } else if (const auto* type = v.as<TypeObject>()) {
      for (const auto& [k, value] : type->members) { names.push_back(k); }
    }
    for (auto& n : builtinAttrNames(v)) { names.push_back(std::move(n)); }
  }
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());
  ValueList out;
  for (auto& n : names) { out.push_back(newStr(std::move(n))); }
  return newList(std::move(out));
}

} // namespace

namespace detail {

void sortValues(Interpreter& interp, ValueList& items, const Value& key, bool reverse) {
  std::vector<std::pair<Value, Value>> keyed;
  keyed.reserve(items.size());
  for (auto& item : items) {
    if (key.isNone()) {
      keyed.emplace_back(item, item);
    } else {
      CallArgs call;
      call.positional.push_back(item);
      keyed.emplace_back(interp.call(key, std::move(call)), item);
    }
  }
  std::stable_sort(keyed.begin(), keyed.end(), [reverse](const auto& a, const auto& b) {
    return reverse ? lessThan(b.first, a.first) : lessThan(a.first, b.first);
  });
  for (std::size_t i = 0; i < items.size(); ++i) { items[i] = std::move(keyed[i].second); }
}

} // namespace detail

std::vector<std::pair<std::string, Value>> builtinFunctions() {
  const BuiltinTypes& t = types();
  std::vector<std::pair<std::string, Value>> out;
  auto add = [&](const char* name, NativeFn f) { out.emplace_back(name, fn(name, std::move(f))); };
  add("print", builtinPrint);
  add("len", builtinLen);
  out.emplace_back("range", Value(t.rangeType));
  add("enumerate", builtinEnumerate);
  add("zip", builtinZip);
  add("map", builtinMap);
  add("filter", builtinFilter);
  add("sorted", builtinSorted);
  add("reversed", builtinReversed);
  out.emplace_back("list", Value(t.listType));
  out.emplace_back("dict", Value(t.dictType));
  out.emplace_back("set", Value(t.setType));
  out.emplace_back("tuple", Value(t.tupleType));
  out.emplace_back("str", Value(t.strType));
  out.emplace_back("int", Value(t.intType));
  out.emplace_back("float", Value(t.floatType));
  out.emplace_back("bool", Value(t.boolType));
  add("abs", builtinAbs);
  add("min", [](Interpreter& i, CallArgs& a) { return minMax(i, a, false); });
  add("max", [](Interpreter& i, CallArgs& a) { return minMax(i, a, true); });
  add("sum", builtinSum);
  add("any", [](Interpreter& i, CallArgs& a) { return builtinAny(i, a, false); });
  add("all", [](Interpreter& i, CallArgs& a) { return builtinAny(i, a, true); });
  add("round", builtinRound);
  add("isinstance", builtinIsinstance);
  add("hasattr", builtinHasattr);
  add("getattr", builtinGetattr);
  add("repr", builtinRepr);
  add("callable", builtinCallable);
  add("iter", builtinIter);
  add("next", builtinNext);
  add("pow", builtinPow);
  add("divmod", builtinDivmod);
  add("ord", builtinOrd);
  add("chr", builtinChr);
  add("hex", [](Interpreter&, CallArgs& a) { return radix(a, "hex", 16, "0x"); });
  add("oct", [](Interpreter&, CallArgs& a) { return radix(a, "oct", 8, "0o"); });
  add("bin", [](Interpreter&, CallArgs& a) { return radix(a, "bin", 2, "0b"); });
  add("dir", builtinDir);
  out.emplace_back("type", Value(t.typeType));
  return out;
}

} // namespace pybox::rt
