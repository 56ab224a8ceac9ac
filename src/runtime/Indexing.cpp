/***
 * Name: pybox::rt indexing and iteration
 * Purpose: Subscript get/set/delete, len() and the iterator protocol for built-in types.
 * Theory of Operation:
 *   String positions are code points. List iterators read the live list so
 *   appends during iteration are seen, as in Python; dict and set iterators
 *   walk a snapshot of the keys.
 */
#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "runtime/Heap.h"
#include "runtime/Native.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/Text.h"

namespace pybox::rt {

namespace {

[[noreturn]] void raiseKeyError(const Value& key) {
  throw ScriptError(make<ExceptionObj>(builtinTypes().keyError, ValueList{key}));
}

std::string indicesMessage(const char* what, const Value& index) {
  return std::string(what) + " indices must be integers or slices, not " + typeName(index);
}

long long sliceIndex(const Value& v) {
  if (v.isIntegral()) { return v.asInt(); }
  raise(builtinTypes().typeError, "slice indices must be integers or None or have an __index__ method");
}

Value makeIterator(std::string name, std::function<std::optional<Value>()> fn) {
  return make<IteratorObj>(std::move(name), std::move(fn));
}

template <typename Seq>
ValueList sliceItems(const Seq& items, const SliceBounds& b) {
  ValueList out;
  out.reserve(static_cast<std::size_t>(b.count));
  for (long long i = 0, pos = b.start; i < b.count; ++i, pos += b.step) {
    out.push_back(items[static_cast<std::size_t>(pos)]);
  }
  return out;
}

void assignSlice(ListObj& list, const SliceObj& slice, const Value& value) {
  ValueList incoming;
  const Value it = getIter(value);
  while (auto next = iterNext(it)) { incoming.push_back(std::move(*next)); }
  const SliceBounds b = sliceBounds(slice, static_cast<long long>(list.items.size()));
  if (b.step == 1) {
    const auto first = list.items.begin() + b.start;
    const auto last = first + (b.count > 0 ? b.count : 0);
    Heap::checkLength(list.items.size() - static_cast<std::size_t>(b.count > 0 ? b.count : 0) + incoming.size());
    const auto pos = list.items.erase(first, last);
    list.items.insert(pos, incoming.begin(), incoming.end());
    return;
  }
  if (static_cast<long long>(incoming.size()) != b.count) {
    raise(builtinTypes().valueError, "attempt to assign sequence of size " + std::to_string(incoming.size()) +
                                         " to extended slice of size " + std::to_string(b.count));
  }
  for (long long i = 0, pos = b.start; i < b.count; ++i, pos += b.step) {
    list.items[static_cast<std::size_t>(pos)] = incoming[static_cast<std::size_t>(i)];
  }
}

void deleteSlice(ListObj& list, const SliceObj& slice) {
  const SliceBounds b = sliceBounds(slice, static_cast<long long>(list.items.size()));
  if (b.count <= 0) { return; }
  std::vector<bool> drop(list.items.size(), false);
  for (long long i = 0, pos = b.start; i < b.count; ++i, pos += b.step) { drop[static_cast<std::size_t>(pos)] = true; }
  ValueList kept;
  kept.reserve(list.items.size() - static_cast<std::size_t>(b.count));
  for (std::size_t i = 0; i < list.items.size(); ++i) {
    if (!drop[i]) { kept.push_back(std::move(list.items[i])); }
  }
  list.items = std::move(kept);
}

} // namespace

std::size_t normalizeIndex(long long index, std::size_t len, const char* what) {
  const auto n = static_cast<long long>(len);
  if (index < 0) { index += n; }
  if (index < 0 || index >= n) { raise(builtinTypes().indexError, std::string(what) + " index out of range"); }
  return static_cast<std::size_t>(index);
}

long long indexValue(const Value& v, const char* what) {
  if (v.isIntegral()) { return v.asInt(); }
  raise(builtinTypes().typeError, indicesMessage(what, v));
}

SliceBounds sliceBounds(const SliceObj& slice, long long len) {
  long long step = slice.step.isNone() ? 1 : sliceIndex(slice.step);
  if (step == 0) { raise(builtinTypes().valueError, "slice step cannot be zero"); }
  long long start = 0;
  long long stop = 0;
  if (step > 0) {
    start = slice.lower.isNone() ? 0 : sliceIndex(slice.lower);
    stop = slice.upper.isNone() ? len : sliceIndex(slice.upper);
    if (start < 0) { start = std::max(0LL, start + len); }
    if (start > len) { start = len; }
    if (stop < 0) { stop = std::max(0LL, stop + len); }
    if (stop > len) { stop = len; }
  } else {
    start = slice.lower.isNone() ? len - 1 : sliceIndex(slice.lower);
    stop = slice.upper.isNone() ? -1 : sliceIndex(slice.upper);
    if (!slice.lower.isNone() && start < 0) { start = std::max(-1LL, start + len); }
    if (start >= len) { start = len - 1; }
    if (!slice.upper.isNone() && stop < 0) { stop = std::max(-1LL, stop + len); }
    if (stop >= len) { stop = len - 1; }
  }
  long long count = 0;
  if (step > 0 && stop > start) { count = (stop - start - 1) / step + 1; }
  if (step < 0 && start > stop) { count = (start - stop - 1) / (-step) + 1; }
  return SliceBounds{start, stop, step, count};
}

Value getItem(const Value& container, const Value& index) {
  if (!container.isObject()) {
    raise(builtinTypes().typeError, "'" + typeName(container) + "' object is not subscriptable");
  }
  const Object* obj = container.object().get();
  const auto* slice = index.as<SliceObj>();
  switch (obj->kind) {
    case ObjKind::Str: {
      const std::u32string cps = text::decode(static_cast<const StrObj*>(obj)->value);
      if (slice != nullptr) {
        const SliceBounds b = sliceBounds(*slice, static_cast<long long>(cps.size()));
        std::u32string out;
        for (long long i = 0, pos = b.start; i < b.count; ++i, pos += b.step) {
          out.push_back(cps[static_cast<std::size_t>(pos)]);
        }
        return newStr(text::encode(out));
      }
      if (!index.isIntegral()) { raise(builtinTypes().typeError, "string indices must be integers, not '" + typeName(index) + "'"); }
      return newStr(text::encode(cps[normalizeIndex(index.asInt(), cps.size(), "string")]));
    }
    case ObjKind::Bytes: {
      const std::string& b = static_cast<const BytesObj*>(obj)->value;
      if (slice != nullptr) {
        const SliceBounds sb = sliceBounds(*slice, static_cast<long long>(b.size()));
        std::string out;
        for (long long i = 0, pos = sb.start; i < sb.count; ++i, pos += sb.step) { out += b[static_cast<std::size_t>(pos)]; }
        return make<BytesObj>(std::move(out));
      }
      const std::size_t i = normalizeIndex(indexValue(index, "byte"), b.size(), "index");
      return Value::integer(static_cast<unsigned char>(b[i]));
    }
    case ObjKind::List: {
      const ValueList& items = static_cast<const ListObj*>(obj)->items;
      if (slice != nullptr) {
        return newList(sliceItems(items, sliceBounds(*slice, static_cast<long long>(items.size()))));
      }
      return items[normalizeIndex(indexValue(index, "list"), items.size(), "list")];
    }
    case ObjKind::Tuple: {
      const ValueList& items = static_cast<const TupleObj*>(obj)->items;
      if (slice != nullptr) {
        return newTuple(sliceItems(items, sliceBounds(*slice, static_cast<long long>(items.size()))));
      }
      return items[normalizeIndex(indexValue(index, "tuple"), items.size(), "tuple")];
    }
    case ObjKind::Dict: {
      if (const Value* found = static_cast<const DictObj*>(obj)->table.find(index)) { return *found; }
      raiseKeyError(index);
    }
    case ObjKind::Range: {
      const auto* r = static_cast<const RangeObj*>(obj);
      if (slice != nullptr) {
        const SliceBounds b = sliceBounds(*slice, r->length());
        const long long step = checkedMul(r->step, b.step);
        const long long start = r->at(b.start);
        return make<RangeObj>(start, checkedAdd(start, checkedMul(b.count, step)), step);
      }
      return Value::integer(r->at(static_cast<long long>(
          normalizeIndex(indexValue(index, "range"), static_cast<std::size_t>(r->length()), "range object"))));
    }
    case ObjKind::Type: {
      const auto* t = static_cast<const TypeObject*>(obj);
      if (t->isEnum) {
        if (const auto* key = index.as<StrObj>()) {
          if (const Value* member = t->findMember(key->value)) { return *member; }
        }
        raiseKeyError(index);
      }
      break;
    }
    default:
      break;
  }
  raise(builtinTypes().typeError, "'" + typeName(container) + "' object is not subscriptable");
}

void setItem(const Value& container, const Value& index, const Value& value) {
  if (auto* list = container.as<ListObj>()) {
    if (const auto* slice = index.as<SliceObj>()) {
      assignSlice(*list, *slice, value);
      return;
    }
    list->items[normalizeIndex(indexValue(index, "list"), list->items.size(), "list assignment")] = value;
    return;
  }
  if (auto* dict = container.as<DictObj>()) {
    dict->table.insert(index, value);
    return;
  }
  raise(builtinTypes().typeError, "'" + typeName(container) + "' object does not support item assignment");
}

void delItem(const Value& container, const Value& index) {
  if (auto* list = container.as<ListObj>()) {
    if (const auto* slice = index.as<SliceObj>()) {
      deleteSlice(*list, *slice);
      return;
    }
    const std::size_t i = normalizeIndex(indexValue(index, "list"), list->items.size(), "list assignment");
    list->items.erase(list->items.begin() + static_cast<std::ptrdiff_t>(i));
    return;
  }
  if (auto* dict = container.as<DictObj>()) {
    if (!dict->table.erase(index)) { raiseKeyError(index); }
    return;
  }
  raise(builtinTypes().typeError, "'" + typeName(container) + "' object doesn't support item deletion");
}

long long length(const Value& v) {
  if (v.isObject()) {
    const Object* obj = v.object().get();
    switch (obj->kind) {
      case ObjKind::Str: return static_cast<long long>(text::length(static_cast<const StrObj*>(obj)->value));
      case ObjKind::Bytes: return static_cast<long long>(static_cast<const BytesObj*>(obj)->value.size());
      case ObjKind::List: return static_cast<long long>(static_cast<const ListObj*>(obj)->items.size());
      case ObjKind::Tuple: return static_cast<long long>(static_cast<const TupleObj*>(obj)->items.size());
      case ObjKind::Dict: return static_cast<long long>(static_cast<const DictObj*>(obj)->table.size());
      case ObjKind::Set: return static_cast<long long>(static_cast<const SetObj*>(obj)->table.size());
      case ObjKind::Range: return static_cast<const RangeObj*>(obj)->length();
      case ObjKind::Type: {
        const auto* t = static_cast<const TypeObject*>(obj);
        if (t->isEnum) {
          long long n = 0;
          for (const auto& [name, member] : t->members) { n += member.as<EnumMember>() != nullptr ? 1 : 0; }
          return n;
        }
        break;
      }
      default:
        break;
    }
  }
  raise(builtinTypes().typeError, "object of type '" + typeName(v) + "' has no len()");
}

Value getIter(const Value& iterable) {
  if (iterable.isObject()) {
    const ObjectPtr& obj = iterable.object();
    switch (obj->kind) {
      case ObjKind::Str: {
        auto cps = std::make_shared<std::u32string>(text::decode(static_cast<const StrObj*>(obj.get())->value));
        return makeIterator("str_iterator", [cps, i = std::size_t{0}]() mutable -> std::optional<Value> {
          if (i >= cps->size()) { return std::nullopt; }
          return newStr(text::encode((*cps)[i++]));
        });
      }
      case ObjKind::Bytes: {
        auto bytes = iterable.share<BytesObj>();
        return makeIterator("bytes_iterator", [bytes, i = std::size_t{0}]() mutable -> std::optional<Value> {
          if (i >= bytes->value.size()) { return std::nullopt; }
          return Value::integer(static_cast<unsigned char>(bytes->value[i++]));
        });
      }
      case ObjKind::List: {
        auto list = iterable.share<ListObj>();
        return makeIterator("list_iterator", [list, i = std::size_t{0}]() mutable -> std::optional<Value> {
          if (i >= list->items.size()) { return std::nullopt; }
          return list->items[i++];
        });
      }
      case ObjKind::Tuple: {
        auto tuple = iterable.share<TupleObj>();
        return makeIterator("tuple_iterator", [tuple, i = std::size_t{0}]() mutable -> std::optional<Value> {
          if (i >= tuple->items.size()) { return std::nullopt; }
          return tuple->items[i++];
        });
      }
      case ObjKind::Dict:
      case ObjKind::Set: {
        const bool isDict = obj->kind == ObjKind::Dict;
        auto keys = std::make_shared<ValueList>(isDict ? static_cast<const DictObj*>(obj.get())->table.keys()
                                                       : static_cast<const SetObj*>(obj.get())->table.keys());
        return makeIterator(isDict ? "dict_keyiterator" : "set_iterator",
                            [keys, i = std::size_t{0}]() mutable -> std::optional<Value> {
                              if (i >= keys->size()) { return std::nullopt; }
                              return (*keys)[i++];
                            });
      }
      case ObjKind::Range: {
        const auto* r = static_cast<const RangeObj*>(obj.get());
        return makeIterator("range_iterator", [start = r->start, step = r->step, n = r->length(),
                                               i = 0LL]() mutable -> std::optional<Value> {
          if (i >= n) { return std::nullopt; }
          return Value::integer(start + (i++) * step);
        });
      }
      case ObjKind::Iterator:
        return iterable;
      case ObjKind::Type: {
        const auto* t = static_cast<const TypeObject*>(obj.get());
        if (!t->isEnum) { break; }
        auto members = std::make_shared<ValueList>();
        for (const auto& [name, member] : t->members) {
          if (member.as<EnumMember>() != nullptr) { members->push_back(member); }
        }
        return makeIterator("enum_iterator", [members, i = std::size_t{0}]() mutable -> std::optional<Value> {
          if (i >= members->size()) { return std::nullopt; }
          return (*members)[i++];
        });
      }
      default:
        break;
    }
  }
  raise(builtinTypes().typeError, "'" + typeName(iterable) + "' object is not iterable");
}

std::optional<Value> iterNext(const Value& iterator) {
  if (auto* it = iterator.as<IteratorObj>()) { return it->next(); }
  raise(builtinTypes().typeError, "'" + typeName(iterator) + "' object is not an iterator");
}

} // namespace pybox::rt
