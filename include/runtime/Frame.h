/***
 * Name: pybox::rt::Frame / ScopeInfo
 * Purpose: Local variable storage for one function (or comprehension) activation.
 * Theory of Operation:
 *   ScopeInfo is computed once per function, lambda or comprehension node:
 *   the names the body binds (locals), names declared global or nonlocal,
 *   and, for comprehensions, walrus targets that bind in the enclosing
 *   scope (forwarded). Frames chain to the frame of the lexically enclosing
 *   function; module-level code runs without a frame against the globals.
 */
#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "ast/Node.h"
#include "runtime/Object.h"
#include "runtime/Value.h"

namespace pybox::rt {

struct ScopeInfo {
  std::unordered_set<std::string> locals;
  std::unordered_set<std::string> globals;
  std::unordered_set<std::string> nonlocals;
  std::unordered_set<std::string> forwarded;
};

struct Frame final : Object {
  std::unordered_map<std::string, Value> vars;
  std::shared_ptr<const ScopeInfo> scope;
  std::shared_ptr<Frame> parent;

  Frame(std::shared_ptr<const ScopeInfo> s, std::shared_ptr<Frame> p)
      : Object(ObjKind::Frame), scope(std::move(s)), parent(std::move(p)) {}
  ~Frame() override {
    ValueList refs;
    refs.reserve(vars.size() + 1);
    for (auto& [name, value] : vars) { refs.push_back(std::move(value)); }
    vars.clear();
    if (parent) { refs.emplace_back(std::move(parent)); }
    releaseIteratively(refs);
  }
  void releaseReferences() override {
    vars.clear();
    parent.reset();
  }
};

// Compute the scope of a FunctionDef, LambdaExpr or comprehension node.
std::shared_ptr<const ScopeInfo> analyzeScope(const ast::Node& node);

} // namespace pybox::rt
