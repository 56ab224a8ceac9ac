/***
 * Name: pybox::ast::GeometrySummary
 * Purpose: Size of a parsed fragment (node count and maximum nesting depth).
 */
#pragma once

#include <cstdint>

namespace pybox::ast {

struct Node;

struct GeometrySummary {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
};

GeometrySummary computeGeometry(const Node& root);

} // namespace pybox::ast
