/***
 * Name: pybox::rt::FunctionObj (teardown)
 * Purpose: Release defaults and the captured frame without recursing through closure chains.
 */
#include "runtime/Callable.h"

#include <utility>

#include "runtime/Frame.h"

namespace pybox::rt {

FunctionObj::~FunctionObj() {
  ValueList refs;
  for (auto& d : defaults) {
    if (d) { refs.push_back(std::move(*d)); }
  }
  defaults.clear();
  if (closure) { refs.emplace_back(std::move(closure)); }
  releaseIteratively(refs);
}

} // namespace pybox::rt
