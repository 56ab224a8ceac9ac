/***
 * Name: pybox::rt::Interpreter
 * Purpose: Tree-walking evaluator for fragment modules.
 * Inputs:
 *   - ast::Module (must outlive the interpreter; functions point into it)
 *   - Globals installed by the embedder (setGlobal / setBuiltin)
 * Outputs:
 *   - Side effects on the globals, the captured console and host objects
 *   - ScriptError for uncaught fragment exceptions
 * Theory of Operation:
 *   Statements return a Flow code (normal, break, continue, return) so loops
 *   and calls unwind without exceptions; fragment exceptions travel as
 *   ScriptError. Names resolve local, enclosing, global, builtin using the
 *   ScopeInfo computed once per function node. Every statement, loop
 *   iteration and call polls the interrupt flag and throws
 *   exceptions::TimeoutFailure when it is set; that exception is not a
 *   ScriptError, so `except` clauses never see it and `finally` blocks are
 *   not run while it unwinds.
 */
#pragma once

#include <csignal>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ast/Nodes.h"
#include "runtime/Callable.h"
#include "runtime/Frame.h"
#include "runtime/Heap.h"
#include "runtime/Objects.h"
#include "runtime/Value.h"

namespace pybox::rt {

struct InterpreterLimits {
  int maxCallDepth{100};
  std::size_t maxSequenceLength{10'000'000};
};

class Interpreter {
 public:
  explicit Interpreter(InterpreterLimits limits = {});
  ~Interpreter();
  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;

  void setGlobal(const std::string& name, Value value);
  void setBuiltin(const std::string& name, Value value);
  // Installs builtinFunctions() and the exposed exception types.
  void installBuiltins();
  const Value* lookupGlobal(const std::string& name) const;
  std::vector<std::string> globalNames() const;

  // Runs module-level statements against the globals.
  void execModule(const ast::Module& module);

  Value call(const Value& callee, CallArgs args);
  // Drives a coroutine to completion; other values are returned unchanged.
  Value await(const Value& value);

  // Attribute read; raises AttributeError when missing.
  Value getAttr(const Value& obj, const std::string& name);
  std::optional<Value> findAttr(const Value& obj, const std::string& name);
  void setAttr(const Value& obj, const std::string& name, const Value& value);

  // Feeds each element to fn until it returns false.
  void iterate(const Value& iterable, const std::function<bool(const Value&)>& fn);
  ValueList materialize(const Value& iterable);

  // Throws TimeoutFailure once the interrupt flag is set.
  void poll() const;
  void setInterruptFlag(const volatile std::sig_atomic_t* flag) { interrupt_ = flag; }

  std::string& console() { return console_; }
  std::mt19937_64& random() { return rng_; }
  void seedRandom(unsigned long long seed) { rng_.seed(seed); }
  Heap& heap() { return heap_; }
  const InterpreterLimits& limits() const { return limits_; }
  // The exception currently being handled by an `except` block, if any.
  Value currentException() const;

 private:
  enum class Flow { Normal, Break, Continue, Return };

  struct Activation {
    std::shared_ptr<Frame> frame; // null at module level
    Value returnValue;
  };

  class CallDepth {
   public:
    explicit CallDepth(Interpreter& interp);
    ~CallDepth() { --interp_.depth_; }
    CallDepth(const CallDepth&) = delete;
    CallDepth& operator=(const CallDepth&) = delete;

   private:
    Interpreter& interp_;
  };

  // Statements (ExecStmt.cpp)
  Flow execBlock(const std::vector<std::unique_ptr<ast::Stmt>>& body, Activation& act);
  Flow exec(const ast::Stmt& stmt, Activation& act);
  Flow execIf(const ast::IfStmt& s, Activation& act);
  Flow execWhile(const ast::WhileStmt& s, Activation& act);
  Flow execFor(const ast::ForStmt& s, Activation& act);
  Flow execTry(const ast::TryStmt& s, Activation& act);
  void execFunctionDef(const ast::FunctionDef& def, Activation& act);
  void execAssign(const ast::AssignStmt& s, Activation& act);
  void execAugAssign(const ast::AugAssignStmt& s, Activation& act);
  void execRaise(const ast::RaiseStmt& s, Activation& act);
  void execDelete(const ast::Expr& target, Activation& act);
  void assign(const ast::Expr& target, const Value& value, Activation& act);
  Value makeExceptionValue(const Value& v);

  // Expressions (EvalExpr.cpp)
  Value eval(const ast::Expr& expr, Activation& act);
  Value evalBinary(const ast::Binary& e, Activation& act);
  Value evalCompare(const ast::Compare& e, Activation& act);
  Value evalCall(const ast::Call& e, Activation& act);
  Value evalSubscriptIndex(const ast::Expr& slice, Activation& act);
  Value evalComprehension(const ast::Expr& e, Activation& act);
  void runFors(const std::vector<ast::ComprehensionFor>& fors, std::size_t index, const Value& iterable,
               Activation& act, const std::function<void()>& emit);
  Value evalFString(const ast::FStringLiteral& f, Activation& act);
  Value evalLambda(const ast::LambdaExpr& e, Activation& act);
  ValueList evalElements(const std::vector<std::unique_ptr<ast::Expr>>& elements, Activation& act);
  std::shared_ptr<FunctionObj> makeFunction(const ast::Node& node, const std::vector<ast::Param>& params,
                                            Activation& act);

  // Names
  Value loadName(const std::string& name, const Activation& act);
  void storeName(const std::string& name, Value value, Activation& act);
  void deleteName(const std::string& name, Activation& act);
  Frame* owningFrame(const std::string& name, Frame* start);

  // Calls (Interpreter.cpp)
  Value runFunction(const std::shared_ptr<FunctionObj>& fn, CallArgs args);
  void bindArguments(const FunctionObj& fn, CallArgs args, Frame& frame);
  std::shared_ptr<const ScopeInfo> scopeFor(const ast::Node& node);

  InterpreterLimits limits_;
  Heap heap_;
  Heap::Scope heapScope_;
  std::unordered_map<std::string, Value> globals_;
  std::unordered_map<std::string, Value> builtins_;
  std::unordered_map<const ast::Node*, std::shared_ptr<const ScopeInfo>> scopes_;
  std::vector<Value> handling_;
  std::string console_;
  std::mt19937_64 rng_;
  int depth_{0};
  const volatile std::sig_atomic_t* interrupt_{nullptr};
};

} // namespace pybox::rt
