/***
 * Name: pybox::sandbox::DryRunHandle
 * Purpose: Self-contained capability handle with no game behind it.
 * Inputs:
 *   - Calls from fragments through the capability proxy
 *   - Scripted outcomes from the embedder (failNext, raiseNext, addMessage)
 * Outputs:
 *   - ActionResult records for every catalog action; simple query answers
 * Theory of Operation:
 *   Keeps a grid position, a turn counter and a message history. Movement
 *   and travel update the position, most actions spend one turn, and item
 *   actions check their inventory letter the way the game layer does. Used by
 *   the CLI to run fragments without a game and by the tests.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sandbox/CapabilityHandle.h"

namespace pybox::sandbox {

class DryRunHandle final : public CapabilityHandle {
 public:
  explicit DryRunHandle(long long x = 10, long long y = 10) : x_(x), y_(y) {}

  bool hasMethod(const std::string& name) const override;
  rt::Value invoke(rt::Interpreter& interp, const std::string& method, rt::CallArgs& args) override;
  std::vector<std::string> methodNames() const override;
  std::optional<rt::Value> property(rt::Interpreter& interp, const std::string& name) override;
  std::vector<std::string> propertyNames() const override;

  std::size_t messageCount() const override { return history_.size(); }
  std::vector<std::string> messagesSince(std::size_t index) const override;
  std::string currentMessage() const override { return current_; }

  // The next call of `method` returns a failed result carrying `error`.
  void failNext(const std::string& method, std::string error);
  // The next call of `method` raises RuntimeError(message) inside the fragment.
  void raiseNext(const std::string& method, std::string message);
  // Appends to the history and makes it the message on screen.
  void addMessage(std::string message);
  void setCurrentMessage(std::string message) { current_ = std::move(message); }

  long long turn() const { return turn_; }
  long long x() const { return x_; }
  long long y() const { return y_; }
  std::size_t invocations() const { return invocations_; }

 private:
  rt::Value act(const std::string& method, rt::CallArgs& args);
  rt::Value query(const std::string& method, rt::CallArgs& args);
  rt::Value explore(rt::CallArgs& args);
  rt::Value succeed(long long turns, std::vector<std::string> messages = {});
  rt::Value stats() const;

  long long x_;
  long long y_;
  long long turn_{1};
  long long depth_{1};
  std::size_t invocations_{0};
  std::vector<std::string> history_{};
  std::string current_{};
  std::unordered_map<std::string, std::string> failures_{};
  std::unordered_map<std::string, std::string> raises_{};
};

} // namespace pybox::sandbox
