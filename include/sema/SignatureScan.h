/***
 * Name: pybox::sema::findEntryPoint
 * Purpose: Locate the suspension-capable entry function of a named fragment.
 * Inputs:
 *   - mod: parsed fragment
 *   - entryName: expected name; empty accepts any
 * Outputs:
 *   - EntryPointMatch{ok, name}
 * Theory of Operation:
 *   Collects every `async def` breadth-first (top level before nested). The
 *   first one carrying the expected name and at least one positional
 *   parameter wins; failing that, the first `async def` found is accepted.
 *   ok is false only when there is no `async def` at all.
 */
#pragma once

#include <string>
#include <vector>

#include "ast/Nodes.h"

namespace pybox::sema {

struct EntryPointMatch {
  bool ok{false};
  std::string name; // empty when no candidate exists
};

std::vector<const ast::FunctionDef*> collectAsyncFunctions(const ast::Module& mod);

EntryPointMatch findEntryPoint(const ast::Module& mod, const std::string& entryName);

} // namespace pybox::sema
