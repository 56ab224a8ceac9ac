/***
 * Name: pybox::rt callables
 * Purpose: Script functions, native builtins and coroutine objects.
 * Theory of Operation:
 *   A FunctionObj points into the syntax tree (def or lambda), so the tree
 *   must outlive the interpreter that runs it. Calling an `async def`
 *   returns a CoroutineObj; awaiting it runs the body to completion exactly
 *   once.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ast/Nodes.h"
#include "runtime/Object.h"
#include "runtime/TypeObject.h"
#include "runtime/Value.h"

namespace pybox::rt {

struct Frame;
struct ScopeInfo;

struct BuiltinFunction final : Object {
  std::string name;
  NativeFn fn;
  Value self; // receiver for bound native methods
  BuiltinFunction(std::string n, NativeFn f, Value s = Value())
      : Object(ObjKind::Builtin), name(std::move(n)), fn(std::move(f)), self(std::move(s)) {}
  void releaseReferences() override {
    self = Value();
    fn = nullptr;
  }
};

struct FunctionObj final : Object {
  std::string name;
  const std::vector<ast::Param>* params{nullptr};
  const ast::FunctionDef* def{nullptr};     // set for def / async def
  const ast::LambdaExpr* lambda{nullptr};   // set for lambda
  std::vector<std::optional<Value>> defaults; // parallel to *params
  std::shared_ptr<Frame> closure;           // enclosing function frame, null at module level
  std::shared_ptr<const ScopeInfo> scope;
  bool isAsync{false};

  FunctionObj() : Object(ObjKind::Function) {}
  ~FunctionObj() override;
  void releaseReferences() override {
    defaults.clear();
    closure.reset();
  }
};

struct CoroutineObj final : Object {
  std::shared_ptr<FunctionObj> fn;
  CallArgs args;
  bool awaited{false};
  CoroutineObj(std::shared_ptr<FunctionObj> f, CallArgs a)
      : Object(ObjKind::Coroutine), fn(std::move(f)), args(std::move(a)) {}
  void releaseReferences() override {
    fn.reset();
    args = CallArgs{};
  }
};

} // namespace pybox::rt
