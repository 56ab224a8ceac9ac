/***
 * Name: pybox::sandbox::CapabilityHandle
 * Purpose: Abstract seam to the live game object a fragment drives.
 * Inputs:
 *   - Method name and call arguments from the fragment (through the proxy)
 * Outputs:
 *   - Script values (records, positions, lists) returned to the fragment
 *   - A state-change message history the sandbox reads before and after a run
 * Theory of Operation:
 *   The orchestrating application owns the handle and implements it; the
 *   sandbox never does. invoke() runs with the interpreter of the current
 *   execution so results can be allocated on its heap. A method that fails
 *   in a way the fragment should be able to catch raises rt::ScriptError;
 *   any other std::exception is turned into a RuntimeError by the proxy.
 *   Calls arrive strictly one at a time.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "runtime/Interpreter.h"
#include "runtime/Value.h"

namespace pybox::sandbox {

class CapabilityHandle {
 public:
  virtual ~CapabilityHandle() = default;

  virtual bool hasMethod(const std::string& name) const = 0;
  virtual rt::Value invoke(rt::Interpreter& interp, const std::string& method, rt::CallArgs& args) = 0;
  virtual std::vector<std::string> methodNames() const = 0;

  // Read-only attributes (turn, position, ...); nullopt when unknown.
  virtual std::optional<rt::Value> property(rt::Interpreter& interp, const std::string& name) {
    (void)interp;
    (void)name;
    return std::nullopt;
  }
  virtual std::vector<std::string> propertyNames() const { return {}; }

  // Message history: every state-change message seen so far, oldest first.
  virtual std::size_t messageCount() const = 0;
  virtual std::vector<std::string> messagesSince(std::size_t index) const = 0;
  // The message currently on screen; empty when none.
  virtual std::string currentMessage() const = 0;

 protected:
  CapabilityHandle() = default;
  CapabilityHandle(const CapabilityHandle&) = default;
  CapabilityHandle& operator=(const CapabilityHandle&) = default;
};

} // namespace pybox::sandbox
