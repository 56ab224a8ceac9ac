/***
 * Name: pybox::rt::detail::NestingGuard
 * Purpose: Bound native recursion through nested containers (repr, ==, hash, ordering).
 */
#pragma once

#include "runtime/ScriptError.h"

namespace pybox::rt::detail {

class NestingGuard {
 public:
  static constexpr int kMaxDepth = 1000;

  explicit NestingGuard(const char* operation) {
    if (++depth() > kMaxDepth) {
      --depth();
      raise(builtinTypes().recursionError, std::string("maximum recursion depth exceeded in ") + operation);
    }
  }
  ~NestingGuard() { --depth(); }
  NestingGuard(const NestingGuard&) = delete;
  NestingGuard& operator=(const NestingGuard&) = delete;

 private:
  static int& depth() {
    thread_local int d = 0;
    return d;
  }
};

} // namespace pybox::rt::detail
