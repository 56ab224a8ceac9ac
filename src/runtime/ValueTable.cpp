/***
 * Name: pybox::rt::ValueTable (implementation)
 * Purpose: Insertion-ordered hash table used by dict and set.
 */
#include <utility>

#include "runtime/Objects.h"
#include "runtime/Ops.h"

namespace pybox::rt {

std::optional<std::size_t> ValueTable::slotOf(const Value& key, std::size_t hash) const {
  auto [it, end] = index_.equal_range(hash);
  for (; it != end; ++it) {
    const auto& slot = slots_[it->second];
    if (slot && equals(slot->key, key)) { return it->second; }
  }
  return std::nullopt;
}

Value* ValueTable::find(const Value& key) {
  const auto slot = slotOf(key, hashValue(key));
  return slot ? &slots_[*slot]->value : nullptr;
}

const Value* ValueTable::find(const Value& key) const {
  const auto slot = slotOf(key, hashValue(key));
  return slot ? &slots_[*slot]->value : nullptr;
}

void ValueTable::insert(const Value& key, Value value) {
  const std::size_t hash = hashValue(key);
  if (const auto slot = slotOf(key, hash)) {
    slots_[*slot]->value = std::move(value);
    return;
  }
  slots_.push_back(Entry{key, std::move(value)});
  index_.emplace(hash, slots_.size() - 1);
  ++live_;
}

bool ValueTable::erase(const Value& key) {
  const std::size_t hash = hashValue(key);
  auto [it, end] = index_.equal_range(hash);
  for (; it != end; ++it) {
    auto& slot = slots_[it->second];
    if (slot && equals(slot->key, key)) {
      slot.reset();
      index_.erase(it);
      --live_;
      if (slots_.size() > 32 && live_ * 2 < slots_.size()) { compact(); }
      return true;
    }
  }
  return false;
}

void ValueTable::clear() {
  slots_.clear();
  index_.clear();
  live_ = 0;
}

ValueList ValueTable::takeAll() {
  ValueList out;
  out.reserve(live_ * 2);
  for (auto& slot : slots_) {
    if (!slot) { continue; }
    out.push_back(std::move(slot->key));
    out.push_back(std::move(slot->value));
  }
  clear();
  return out;
}

std::vector<ValueTable::Entry> ValueTable::entries() const {
  std::vector<Entry> out;
  out.reserve(live_);
  for (const auto& slot : slots_) {
    if (slot) { out.push_back(*slot); }
  }
  return out;
}

ValueList ValueTable::keys() const {
  ValueList out;
  out.reserve(live_);
  for (const auto& slot : slots_) {
    if (slot) { out.push_back(slot->key); }
  }
  return out;
}

std::optional<ValueTable::Entry> ValueTable::popLast() {
  for (auto i = slots_.size(); i > 0; --i) {
    if (slots_[i - 1]) {
      Entry e = *slots_[i - 1];
      erase(e.key);
      return e;
    }
  }
  return std::nullopt;
}

std::optional<ValueTable::Entry> ValueTable::popFirst() {
  for (const auto& slot : slots_) {
    if (slot) {
      Entry e = *slot;
      erase(e.key);
      return e;
    }
  }
  return std::nullopt;
}

void ValueTable::compact() {
  std::vector<std::optional<Entry>> kept;
  kept.reserve(live_);
  index_.clear();
  for (auto& slot : slots_) {
    if (slot) {
      index_.emplace(hashValue(slot->key), kept.size());
      kept.push_back(std::move(slot));
    }
  }
  slots_ = std::move(kept);
}

} // namespace pybox::rt
