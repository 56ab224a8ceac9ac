/***
 * Name: pybox::rt::Heap
 * Purpose: Track objects allocated by one interpreter so cycles can be broken at teardown.
 * Inputs:
 *   - Objects created through rt::make<T>() while a Heap::Scope is active
 * Outputs:
 *   - HeapStats (allocation counters)
 * Theory of Operation:
 *   Objects are reference counted. Script code can build cycles (a list that
 *   contains itself, a closure stored in its own frame), so the heap keeps a
 *   weak reference to every allocation and releaseAll() asks each survivor to
 *   drop its references. Expired entries are pruned whenever the registry
 *   doubles in size. The active heap is per thread; each sandbox execution
 *   owns one, and the heap also enforces the element-count cap on
 *   materialised sequences.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "runtime/Object.h"

namespace pybox::rt {

struct HeapStats {
  std::size_t allocated{0};
  std::size_t tracked{0};
  std::size_t released{0};
};

class Heap {
 public:
  Heap() = default;
  ~Heap() { releaseAll(); }
  Heap(const Heap&) = delete;
  Heap& operator=(const Heap&) = delete;

  void track(const std::shared_ptr<Object>& obj);
  void releaseAll();
  HeapStats stats() const { return stats_; }

  void setMaxSequenceLength(std::size_t n) { maxSequenceLength_ = n; }
  std::size_t maxSequenceLength() const { return maxSequenceLength_; }

  static Heap* current();
  // Raises MemoryError when a sequence of n elements would exceed the active heap's cap.
  static void checkLength(std::size_t n);

  // Makes a heap the allocation target for the current thread.
  class Scope {
   public:
    explicit Scope(Heap& heap);
    ~Scope();
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

   private:
    Heap* previous_;
  };

 private:
  void prune();

  std::vector<std::weak_ptr<Object>> objects_{};
  std::size_t pruneAt_{1024};
  std::size_t maxSequenceLength_{10'000'000};
  HeapStats stats_{};
};

template <typename T, typename... Args>
std::shared_ptr<T> make(Args&&... args) {
  std::shared_ptr<T> obj(new T(std::forward<Args>(args)...));
  if (Heap* heap = Heap::current()) { heap->track(obj); }
  return obj;
}

} // namespace pybox::rt
