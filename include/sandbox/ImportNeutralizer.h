/***
 * Name: pybox::sandbox::neutralizeImports
 * Purpose: Replace every import statement of a validated fragment with `pass`.
 * Inputs:
 *   - Parsed module (mutated in place)
 * Outputs:
 *   - Number of statements replaced
 * Theory of Operation:
 *   The namespace already carries every module a fragment may import, so an
 *   import has nothing left to do at run time. Statement lists are visited
 *   recursively (function, class, branch, loop, try and with bodies); the
 *   replacement keeps the original line so diagnostics still point at it.
 */
#pragma once

#include <cstddef>

#include "ast/Nodes.h"

namespace pybox::sandbox {

std::size_t neutralizeImports(ast::Module& module);

} // namespace pybox::sandbox
