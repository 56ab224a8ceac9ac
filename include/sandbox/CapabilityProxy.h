/***
 * Name: pybox::sandbox::CapabilityProxy
 * Purpose: The `nh` object a fragment sees: forwards to the capability handle
 *   and records every action call.
 * Inputs:
 *   - CapabilityHandle (borrowed; must outlive the proxy's execution)
 *   - Optional cooperative Deadline checked before every forwarded call
 * Outputs:
 *   - The handle's return values, unchanged
 *   - One APICallRecord per action-catalog call, in call order
 *   - The exploration outcome of the last `autoexplore` call
 * Theory of Operation:
 *   Only handle methods and handle properties are reachable; nothing else
 *   about the proxy or the handle is visible to script code. Query methods
 *   pass through untracked. A call that raises (a fragment-level error from
 *   the handle) propagates to the fragment and leaves no record.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "runtime/Interpreter.h"
#include "runtime/Native.h"
#include "runtime/Value.h"
#include "sandbox/CapabilityHandle.h"
#include "sandbox/TimeoutGovernor.h"

namespace pybox::sandbox {

struct APICallRecord {
  std::string method;
  std::string formattedArgs;
  bool success{true};
  std::optional<std::string> error; // translated hint, set only on failure
};

struct ExplorationOutcome {
  std::string stopReason;
  long long stepsTaken{0};
  std::string message;
};

// Actionable hint for a raw failure message; the raw text when no pattern matches.
std::string translateError(const std::string& raw, const std::string& method);

// Short human-readable rendering of an action call's arguments.
std::string formatArguments(rt::Interpreter& interp, const std::string& method, const rt::CallArgs& args);

class CapabilityProxy final : public rt::NativeObject {
 public:
  CapabilityProxy(CapabilityHandle& handle, const Deadline* deadline) : handle_(handle), deadline_(deadline) {}

  rt::TypePtr type() const override;
  std::optional<rt::Value> getAttr(rt::Interpreter& interp, const rt::Value& self, const std::string& name) override;
  std::vector<std::string> attrNames() const override;
  std::string repr() const override { return "<nh>"; }

  // Forward one call to the handle, recording it when it is an action.
  rt::Value call(rt::Interpreter& interp, const std::string& method, rt::CallArgs args);

  const std::vector<APICallRecord>& calls() const { return calls_; }
  const std::optional<ExplorationOutcome>& exploration() const { return exploration_; }

 private:
  void record(rt::Interpreter& interp, const std::string& method, std::string formattedArgs, const rt::Value& result);

  CapabilityHandle& handle_;
  const Deadline* deadline_;
  std::vector<APICallRecord> calls_{};
  std::optional<ExplorationOutcome> exploration_{};
};

} // namespace pybox::sandbox
