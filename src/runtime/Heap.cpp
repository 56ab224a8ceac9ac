/***
 * Name: pybox::rt::Heap (implementation)
 * Purpose: Weak registry of interpreter allocations and teardown release.
 */
#include "runtime/Heap.h"

#include <algorithm>
#include <string>
#include <utility>

#include "runtime/ScriptError.h"

namespace pybox::rt {

namespace {
thread_local Heap* activeHeap = nullptr;
thread_local ValueList* releaseQueue = nullptr;
} // namespace

void releaseIteratively(ValueList& refs) noexcept {
  if (refs.empty()) { return; }
  if (releaseQueue != nullptr) {
    for (auto& v : refs) { releaseQueue->push_back(std::move(v)); }
    refs.clear();
    return;
  }
  ValueList queue;
  queue.swap(refs);
  releaseQueue = &queue;
  while (!queue.empty()) {
    // Destroyed at the end of the iteration; its children land in `queue`.
    Value last = std::move(queue.back());
    queue.pop_back();
  }
  releaseQueue = nullptr;
}

Heap* Heap::current() { return activeHeap; }

void Heap::checkLength(std::size_t n) {
  const Heap* heap = activeHeap;
  const std::size_t cap = heap != nullptr ? heap->maxSequenceLength_ : std::size_t{10'000'000};
  if (n > cap) {
    raise(builtinTypes().memoryError, "sequence of " + std::to_string(n) + " elements exceeds the limit of " +
                                          std::to_string(cap));
  }
}

Heap::Scope::Scope(Heap& heap) : previous_(activeHeap) { activeHeap = &heap; }

Heap::Scope::~Scope() { activeHeap = previous_; }

void Heap::track(const std::shared_ptr<Object>& obj) {
  objects_.emplace_back(obj);
  ++stats_.allocated;
  if (objects_.size() >= pruneAt_) {
    prune();
    pruneAt_ = std::max<std::size_t>(1024, objects_.size() * 2);
  }
  stats_.tracked = objects_.size();
}

void Heap::prune() {
  objects_.erase(std::remove_if(objects_.begin(), objects_.end(),
                                [](const std::weak_ptr<Object>& w) { return w.expired(); }),
                 objects_.end());
}

void Heap::releaseAll() {
  // Lock everything first so releasing one object cannot destroy another
  // that is still waiting for its turn.
  std::vector<std::shared_ptr<Object>> live;
  live.reserve(objects_.size());
  for (const auto& w : objects_) {
    if (auto obj = w.lock()) { live.push_back(std::move(obj)); }
  }
  objects_.clear();
  for (const auto& obj : live) { obj->releaseReferences(); }
  stats_.released += live.size();
  stats_.tracked = 0;
}

} // namespace pybox::rt
