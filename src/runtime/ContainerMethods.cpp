/***
 * Name: pybox::rt container methods
 * Purpose: Native methods of list, tuple, dict and set.
 * Theory of Operation:
 *   dict.keys(), values() and items() return list snapshots rather than live
 *   views. Set algebra builds a fresh set and leaves the receiver untouched
 *   except for the *_update variants.
 */
#include <algorithm>
#include <string>
#include <utility>

#include "runtime/Builtins.h"
#include "runtime/Heap.h"
#include "runtime/Interpreter.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/detail/ArgReader.h"
#include "runtime/detail/Methods.h"

namespace pybox::rt::detail {

namespace {

const BuiltinTypes& types() { return builtinTypes(); }

ValueList& items(const Value& v) { return v.as<ListObj>()->items; }
ValueTable& table(const Value& v) {
  if (auto* d = v.as<DictObj>()) { return d->table; }
  return v.as<SetObj>()->table;
}

[[noreturn]] void raiseKey(const Value& key) {
  throw ScriptError(make<ExceptionObj>(types().keyError, ValueList{key}));
}

// Bounds for index()/count() style start/stop arguments.
std::pair<std::size_t, std::size_t> window(const ArgReader& r, std::size_t first, std::size_t len) {
  auto bound = [&](std::size_t i, long long fallback) {
    if (!r.has(i)) { return fallback; }
    long long v = toInteger(r.at(i));
    if (v < 0) { v = std::max(0LL, v + static_cast<long long>(len)); }
    return std::min(v, static_cast<long long>(len));
  };
  return {static_cast<std::size_t>(bound(first, 0)),
          static_cast<std::size_t>(bound(first + 1, static_cast<long long>(len)))};
}

Value sequenceIndex(const ValueList& seq, CallArgs& args, const char* what) {
  ArgReader r("index", args);
  r.noKeywords();
  r.expect(1, 3);
  const auto [begin, end] = window(r, 1, seq.size());
  for (std::size_t i = begin; i < end && i < seq.size(); ++i) {
    if (equals(seq[i], r.at(0))) { return Value::integer(static_cast<long long>(i)); }
  }
  raise(types().valueError, std::string(what) + ".index(x): x not in " + what);
}

Value sequenceCount(const ValueList& seq, CallArgs& args) {
  ArgReader r("count", args);
  r.noKeywords();
  r.expect(1, 1);
  const auto n = std::count_if(seq.begin(), seq.end(), [&](const Value& v) { return equals(v, r.at(0)); });
  return Value::integer(static_cast<long long>(n));
}

// list

Value listAppend(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("append", args);
  r.noKeywords();
  r.expect(1, 1);
  Heap::checkLength(items(self).size() + 1);
  items(self).push_back(r.at(0));
  return Value();
}

Value listExtend(Interpreter& interp, const Value& self, CallArgs& args) {
  ArgReader r("extend", args);
  r.noKeywords();
  r.expect(1, 1);
  ValueList extra = interp.materialize(r.at(0));
  Heap::checkLength(items(self).size() + extra.size());
  auto& target = items(self);
  target.insert(target.end(), extra.begin(), extra.end());
  return Value();
}

Value listInsert(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("insert", args);
  r.noKeywords();
  r.expect(2, 2);
  auto& seq = items(self);
  const long long len = static_cast<long long>(seq.size());
  long long at = r.integer(0);
  if (at < 0) { at = std::max(0LL, at + len); }
  at = std::min(at, len);
  Heap::checkLength(seq.size() + 1);
  seq.insert(seq.begin() + at, r.at(1));
  return Value();
}

Value listPop(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("pop", args);
  r.noKeywords();
  r.expect(0, 1);
  auto& seq = items(self);
  if (seq.empty()) { raise(types().indexError, "pop from empty list"); }
  long long at = r.has(0) ? r.integer(0) : -1;
  if (at < 0) { at += static_cast<long long>(seq.size()); }
  if (at < 0 || at >= static_cast<long long>(seq.size())) { raise(types().indexError, "pop index out of range"); }
  Value out = seq[static_cast<std::size_t>(at)];
  seq.erase(seq.begin() + at);
  return out;
}

Value listRemove(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("remove", args);
  r.noKeywords();
  r.expect(1, 1);
  auto& seq = items(self);
  for (auto it = seq.begin(); it != seq.end(); ++it) {
    if (equals(*it, r.at(0))) {
      seq.erase(it);
      return Value();
    }
  }
  raise(types().valueError, "list.remove(x): x not in list");
}

Value listIndex(Interpreter&, const Value& self, CallArgs& args) {
  const ValueList snapshot = items(self);
  return sequenceIndex(snapshot, args, "list");
}

Value listCount(Interpreter&, const Value& self, CallArgs& args) {
  const ValueList snapshot = items(self);
  return sequenceCount(snapshot, args);
}

Value listSort(Interpreter& interp, const Value& self, CallArgs& args) {
  ArgReader r("sort", args);
  if (r.count() != 0) { raise(types().typeError, "sort() takes no positional arguments"); }
  const Value key = r.keyword("key").value_or(Value());
  const bool reverse = truthy(r.keyword("reverse").value_or(Value::boolean(false)));
  r.finish();
  ValueList work = std::move(items(self));
  items(self).clear();
  sortValues(interp, work, key, reverse);
  if (!items(self).empty()) { raise(types().valueError, "list modified during sort"); }
  items(self) = std::move(work);
  return Value();
}

Value listReverse(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("reverse", args);
  r.noKeywords();
  r.expect(0, 0);
  std::reverse(items(self).begin(), items(self).end());
  return Value();
}

Value listCopy(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("copy", args);
  r.noKeywords();
  r.expect(0, 0);
  return newList(items(self));
}

Value listClear(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("clear", args);
  r.noKeywords();
  r.expect(0, 0);
  items(self).clear();
  return Value();
}

// tuple

Value tupleIndex(Interpreter&, const Value& self, CallArgs& args) {
  return sequenceIndex(self.as<TupleObj>()->items, args, "tuple");
}

Value tupleCount(Interpreter&, const Value& self, CallArgs& args) {
  return sequenceCount(self.as<TupleObj>()->items, args);
}

// dict

Value dictKeys(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("keys", args);
  r.noKeywords();
  r.expect(0, 0);
  return newList(table(self).keys());
}

Value dictValues(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("values", args);
  r.noKeywords();
  r.expect(0, 0);
  ValueList out;
  for (const auto& e : table(self).entries()) { out.push_back(e.value); }
  return newList(std::move(out));
}

Value dictItems(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("items", args);
  r.noKeywords();
  r.expect(0, 0);
  ValueList out;
  for (const auto& e : table(self).entries()) { out.push_back(newTuple({e.key, e.value})); }
  return newList(std::move(out));
}

Value dictGet(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("get", args);
  r.noKeywords();
  r.expect(1, 2);
  if (const Value* v = table(self).find(r.at(0))) { return *v; }
  return r.has(1) ? r.at(1) : Value();
}

Value dictPop(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("pop", args);
  r.noKeywords();
  r.expect(1, 2);
  auto& t = table(self);
  if (const Value* v = t.find(r.at(0))) {
    Value out = *v;
    t.erase(r.at(0));
    return out;
  }
  if (r.has(1)) { return r.at(1); }
  raiseKey(r.at(0));
}

Value dictPopitem(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("popitem", args);
  r.noKeywords();
  r.expect(0, 0);
  auto last = table(self).popLast();
  if (!last) { raise(types().keyError, "popitem(): dictionary is empty"); }
  return newTuple({last->key, last->value});
}

Value dictSetdefault(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("setdefault", args);
  r.noKeywords();
  r.expect(1, 2);
  auto& t = table(self);
  if (const Value* v = t.find(r.at(0))) { return *v; }
  Value fallback = r.has(1) ? r.at(1) : Value();
  Heap::checkLength(t.size() + 1);
  t.insert(r.at(0), fallback);
  return fallback;
}

Value dictUpdate(Interpreter& interp, const Value& self, CallArgs& args) {
  ArgReader r("update", args);
  r.expect(0, 1);
  auto& t = table(self);
  if (r.count() == 1) {
    if (const auto* other = r.at(0).as<DictObj>()) {
      for (const auto& e : other->table.entries()) { t.insert(e.key, e.value); }
    } else {
      std::size_t index = 0;
      interp.iterate(r.at(0), [&](const Value& item) {
        ValueList kv = interp.materialize(item);
        if (kv.size() != 2) {
          raise(types().valueError, "dictionary update sequence element #" + std::to_string(index) + " has length " +
                                        std::to_string(kv.size()) + "; 2 is required");
        }
        ++index;
        t.insert(kv[0], kv[1]);
        return true;
      });
    }
  }
  for (auto& [name, value] : args.keywords) { t.insert(newStr(name), value); }
  Heap::checkLength(t.size());
  return Value();
}

Value dictCopy(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("copy", args);
  r.noKeywords();
  r.expect(0, 0);
  Value out = newDict();
  for (const auto& e : table(self).entries()) { out.as<DictObj>()->table.insert(e.key, e.value); }
  return out;
}

Value tableClear(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("clear", args);
  r.noKeywords();
  r.expect(0, 0);
  table(self).clear();
  return Value();
}

// set

Value setOf(const ValueList& values) {
  Value out = newSet();
  for (const auto& v : values) { out.as<SetObj>()->table.insert(v, Value()); }
  return out;
}

ValueList members(Interpreter& interp, const Value& v) {
  if (const auto* s = v.as<SetObj>()) { return s->table.keys(); }
  if (const auto* d = v.as<DictObj>()) { return d->table.keys(); }
  return interp.materialize(v);
}

Value setAdd(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("add", args);
  r.noKeywords();
  r.expect(1, 1);
  auto& t = table(self);
  Heap::checkLength(t.size() + 1);
  if (!t.contains(r.at(0))) { t.insert(r.at(0), Value()); }
  return Value();
}

Value setRemove(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("remove", args);
  r.noKeywords();
  r.expect(1, 1);
  if (!table(self).erase(r.at(0))) { raiseKey(r.at(0)); }
  return Value();
}

Value setDiscard(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("discard", args);
  r.noKeywords();
  r.expect(1, 1);
  table(self).erase(r.at(0));
  return Value();
}

Value setPop(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("pop", args);
  r.noKeywords();
  r.expect(0, 0);
  auto first = table(self).popFirst();
  if (!first) { raise(types().keyError, "pop from an empty set"); }
  return first->key;
}

Value setCopy(Interpreter&, const Value& self, CallArgs& args) {
  ArgReader r("copy", args);
  r.noKeywords();
  r.expect(0, 0);
  return setOf(table(self).keys());
}

enum class SetOp { Union, Intersection, Difference, Symmetric };

// Applies `op` to `base` with each positional argument in turn.
ValueList combine(Interpreter& interp, ValueList base, CallArgs& args, const char* name, SetOp op) {
  ArgReader r(name, args);
  r.noKeywords();
  if (op == SetOp::Symmetric) { r.expect(1, 1); }
  for (const auto& arg : r.positional()) {
    const Value other = setOf(members(interp, arg));
    const auto& ot = other.as<SetObj>()->table;
    const Value current = setOf(base);
    const auto& ct = current.as<SetObj>()->table;
    ValueList next;
    switch (op) {
      case SetOp::Union:
        next = base;
        for (const auto& v : ot.keys()) {
          if (!ct.contains(v)) { next.push_back(v); }
        }
        break;
      case SetOp::Intersection:
        for (const auto& v : base) {
          if (ot.contains(v)) { next.push_back(v); }
        }
        break;
      case SetOp::Difference:
        for (const auto& v : base) {
          if (!ot.contains(v)) { next.push_back(v); }
        }
        break;
      case SetOp::Symmetric:
        for (const auto& v : base) {
          if (!ot.contains(v)) { next.push_back(v); }
        }
        for (const auto& v : ot.keys()) {
          if (!ct.contains(v)) { next.push_back(v); }
        }
        break;
    }
    Heap::checkLength(next.size());
    base = std::move(next);
  }
  return base;
}

template <SetOp Op>
Value setAlgebra(Interpreter& interp, const Value& self, CallArgs& args) {
  static constexpr const char* names[] = {"union", "intersection", "difference", "symmetric_difference"};
  return setOf(combine(interp, table(self).keys(), args, names[static_cast<int>(Op)], Op));
}

template <SetOp Op>
Value setAlgebraUpdate(Interpreter& interp, const Value& self, CallArgs& args) {
  static constexpr const char* names[] = {"update", "intersection_update", "difference_update",
                                          "symmetric_difference_update"};
  ValueList result = combine(interp, table(self).keys(), args, names[static_cast<int>(Op)], Op);
  auto& t = table(self);
  t.clear();
  for (const auto& v : result) { t.insert(v, Value()); }
  return Value();
}

Value setIssubset(Interpreter& interp, const Value& self, CallArgs& args) {
  ArgReader r("issubset", args);
  r.noKeywords();
  r.expect(1, 1);
  const Value other = setOf(members(interp, r.at(0)));
  const auto& ot = other.as<SetObj>()->table;
  const ValueList mine = table(self).keys();
  return Value::boolean(std::all_of(mine.begin(), mine.end(), [&](const Value& v) { return ot.contains(v); }));
}

Value setIssuperset(Interpreter& interp, const Value& self, CallArgs& args) {
  ArgReader r("issuperset", args);
  r.noKeywords();
  r.expect(1, 1);
  const ValueList theirs = members(interp, r.at(0));
  const auto& t = table(self);
  return Value::boolean(std::all_of(theirs.begin(), theirs.end(), [&](const Value& v) { return t.contains(v); }));
}

Value setIsdisjoint(Interpreter& interp, const Value& self, CallArgs& args) {
  ArgReader r("isdisjoint", args);
  r.noKeywords();
  r.expect(1, 1);
  const ValueList theirs = members(interp, r.at(0));
  const auto& t = table(self);
  return Value::boolean(std::none_of(theirs.begin(), theirs.end(), [&](const Value& v) { return t.contains(v); }));
}

} // namespace

const std::vector<MethodEntry>& listMethods() {
  static const std::vector<MethodEntry> methods{
      {"append", &listAppend}, {"clear", &listClear}, {"copy", &listCopy},       {"count", &listCount},
      {"extend", &listExtend}, {"index", &listIndex}, {"insert", &listInsert},   {"pop", &listPop},
      {"remove", &listRemove}, {"reverse", &listReverse}, {"sort", &listSort},
  };
  return methods;
}

const std::vector<MethodEntry>& tupleMethods() {
  static const std::vector<MethodEntry> methods{{"count", &tupleCount}, {"index", &tupleIndex}};
  return methods;
}

const std::vector<MethodEntry>& dictMethods() {
  static const std::vector<MethodEntry> methods{
      {"clear", &tableClear}, {"copy", &dictCopy},         {"get", &dictGet},
      {"items", &dictItems},  {"keys", &dictKeys},         {"pop", &dictPop},
      {"popitem", &dictPopitem}, {"setdefault", &dictSetdefault}, {"update", &dictUpdate},
      {"values", &dictValues},
  };
  return methods;
}

const std::vector<MethodEntry>& setMethods() {
  static const std::vector<MethodEntry> methods{
      {"add", &setAdd},
      {"clear", &tableClear},
      {"copy", &setCopy},
      {"difference", &setAlgebra<SetOp::Difference>},
      {"difference_update", &setAlgebraUpdate<SetOp::Difference>},
      {"discard", &setDiscard},
      {"intersection", &setAlgebra<SetOp::Intersection>},
      {"intersection_update", &setAlgebraUpdate<SetOp::Intersection>},
      {"isdisjoint", &setIsdisjoint},
      {"issubset", &setIssubset},
      {"issuperset", &setIssuperset},
      {"pop", &setPop},
      {"remove", &setRemove},
      {"symmetric_difference", &setAlgebra<SetOp::Symmetric>},
      {"symmetric_difference_update", &setAlgebraUpdate<SetOp::Symmetric>},
      {"union", &setAlgebra<SetOp::Union>},
      {"update", &setAlgebraUpdate<SetOp::Union>},
  };
  return methods;
}

} // namespace pybox::rt::detail
