/***
 * Name: pybox::sandbox::buildNamespace
 * Purpose: Populate a fresh interpreter with everything a fragment may name.
 * Inputs:
 *   - Interpreter of the current execution
 *   - The capability proxy value (bound as `nh`)
 *   - SandboxConfig (random seed)
 * Outputs:
 *   - Builtins, domain types, the `random` and `math` modules and `nh` as globals
 * Theory of Operation:
 *   Nothing else is reachable: there is no import machinery and no way to
 *   reach the host from any installed object.
 */
#pragma once

#include <string>
#include <vector>

#include "runtime/Interpreter.h"
#include "runtime/Value.h"
#include "sandbox/SandboxConfig.h"

namespace pybox::sandbox {

inline constexpr const char* kHandleName = "nh";

void buildNamespace(rt::Interpreter& interp, const rt::Value& handleProxy, const SandboxConfig& config);

// Globals installed next to the builtins, in install order.
std::vector<std::string> namespaceGlobals();

} // namespace pybox::sandbox
