/***
 * Name: pybox::sandbox::Sandbox
 * Purpose: Validate and run one untrusted fragment against a capability handle.
 * Inputs:
 *   - CodeSubmission (source, mode, entry name, parameters, optional timeout)
 *   - CapabilityHandle supplied by the caller
 * Outputs:
 *   - sema::ValidationResult from validate()
 *   - ExecutionResult from execute(); nothing the fragment does escapes as an exception
 * Theory of Operation:
 *   execute() validates first and never runs a rejected fragment. A passing
 *   fragment has its imports replaced by `pass` and runs in a fresh
 *   interpreter whose namespace holds only the builtins, the domain types and
 *   the proxied handle. Ad-hoc fragments are wrapped in `async def
 *   __adhoc__(nh)`. The preemptive timer and the cooperative deadline are
 *   armed after validation, right before the module runs, and the timer guard
 *   is released on every exit path. The sandbox keeps no state between calls.
 */
#pragma once

#include <memory>
#include <string>

#include "ast/Nodes.h"
#include "sandbox/CapabilityHandle.h"
#include "sandbox/ExecutionResult.h"
#include "sandbox/SandboxConfig.h"
#include "sema/FragmentMode.h"
#include "sema/Validator.h"

namespace pybox::sandbox {

inline constexpr const char* kAdHocEntry = "__adhoc__";

// Moves the module's statements into `async def __adhoc__(nh)`.
std::unique_ptr<ast::Module> wrapAdHoc(std::unique_ptr<ast::Module> module);

class Sandbox {
 public:
  // Throws exceptions::ConfigError for an invalid configuration.
  explicit Sandbox(SandboxConfig config = {});

  const SandboxConfig& config() const { return config_; }

  sema::ValidationResult validate(const std::string& source, sema::FragmentMode mode,
                                  const std::string& entryName = "") const;

  ExecutionResult execute(const CodeSubmission& submission, CapabilityHandle& handle) const;

 private:
  SandboxConfig config_;
};

} // namespace pybox::sandbox
