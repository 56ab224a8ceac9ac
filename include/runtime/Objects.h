/***
 * Name: pybox::rt containers
 * Purpose: Built-in object types: str, bytes, list, tuple, dict, set, range, slice, iterator, module.
 * Theory of Operation:
 *   dict and set share ValueTable, an insertion-ordered hash table keyed by
 *   script values. Deleted slots are tombstoned and compacted once they
 *   outnumber the live entries, so iteration order is always insertion order.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "runtime/Object.h"
#include "runtime/Value.h"

namespace pybox::rt {

struct StrObj final : Object {
  std::string value; // UTF-8
  explicit StrObj(std::string v) : Object(ObjKind::Str), value(std::move(v)) {}
};

struct BytesObj final : Object {
  std::string value;
  explicit BytesObj(std::string v) : Object(ObjKind::Bytes), value(std::move(v)) {}
};

struct ListObj final : Object {
  ValueList items;
  ListObj() : Object(ObjKind::List) {}
  explicit ListObj(ValueList v) : Object(ObjKind::List), items(std::move(v)) {}
  ~ListObj() override { releaseIteratively(items); }
  void releaseReferences() override { items.clear(); }
};

struct TupleObj final : Object {
  ValueList items;
  TupleObj() : Object(ObjKind::Tuple) {}
  explicit TupleObj(ValueList v) : Object(ObjKind::Tuple), items(std::move(v)) {}
  ~TupleObj() override { releaseIteratively(items); }
  void releaseReferences() override { items.clear(); }
};

class ValueTable {
 public:
  struct Entry {
    Value key;
    Value value;
  };

  // Throw TypeError for unhashable keys.
  Value* find(const Value& key);
  const Value* find(const Value& key) const;
  bool contains(const Value& key) const { return find(key) != nullptr; }
  void insert(const Value& key, Value value);
  bool erase(const Value& key);
  void clear();
  // Removes every entry, handing keys and values to the caller.
  ValueList takeAll();
  std::size_t size() const { return live_; }
  bool empty() const { return live_ == 0; }

  // Live entries in insertion order.
  std::vector<Entry> entries() const;
  ValueList keys() const;
  // Removes and returns the most recently inserted entry.
  std::optional<Entry> popLast();
  // Removes and returns the oldest entry.
  std::optional<Entry> popFirst();

 private:
  std::optional<std::size_t> slotOf(const Value& key, std::size_t hash) const;
  void compact();

  std::vector<std::optional<Entry>> slots_{};
  std::unordered_multimap<std::size_t, std::size_t> index_{};
  std::size_t live_{0};
};

struct DictObj final : Object {
  ValueTable table;
  DictObj() : Object(ObjKind::Dict) {}
  ~DictObj() override {
    ValueList refs = table.takeAll();
    releaseIteratively(refs);
  }
  void releaseReferences() override { table.clear(); }
};

struct SetObj final : Object {
  ValueTable table; // values unused
  SetObj() : Object(ObjKind::Set) {}
  ~SetObj() override {
    ValueList refs = table.takeAll();
    releaseIteratively(refs);
  }
  void releaseReferences() override { table.clear(); }
};

struct RangeObj final : Object {
  long long start;
  long long stop;
  long long step;
  RangeObj(long long b, long long e, long long s) : Object(ObjKind::Range), start(b), stop(e), step(s) {}
  long long length() const {
    if (step > 0 && start < stop) { return (stop - start - 1) / step + 1; }
    if (step < 0 && start > stop) { return (start - stop - 1) / (-step) + 1; }
    return 0;
  }
  long long at(long long i) const { return start + i * step; }
};

struct SliceObj final : Object {
  Value lower;
  Value upper;
  Value step;
  SliceObj(Value l, Value u, Value s) : Object(ObjKind::Slice), lower(std::move(l)), upper(std::move(u)), step(std::move(s)) {}
  void releaseReferences() override { lower = upper = step = Value(); }
};

// Generic iterator; next() yields std::nullopt once exhausted.
struct IteratorObj final : Object {
  std::function<std::optional<Value>()> next;
  std::string typeName;
  IteratorObj(std::string tn, std::function<std::optional<Value>()> fn)
      : Object(ObjKind::Iterator), next(std::move(fn)), typeName(std::move(tn)) {}
  void releaseReferences() override { next = [] { return std::optional<Value>(); }; }
};

struct ModuleObj final : Object {
  std::string name;
  std::vector<std::pair<std::string, Value>> attrs;
  explicit ModuleObj(std::string n) : Object(ObjKind::Module), name(std::move(n)) {}
  const Value* find(const std::string& attr) const {
    for (const auto& [k, v] : attrs) {
      if (k == attr) { return &v; }
    }
    return nullptr;
  }
  void releaseReferences() override { attrs.clear(); }
};

} // namespace pybox::rt
