/***
 * Name: pybox::ast::computeGeometry
 * Purpose: Count nodes and measure maximum depth of a parsed fragment.
 */
#include "ast/GeometrySummary.h"

#include <algorithm>

#include "ast/TreeWalker.h"

namespace pybox::ast {

namespace {
class GeometryWalker : public TreeWalker {
 public:
  GeometrySummary summary{};

 protected:
  void walk(const Node* node) override {
    if (node == nullptr) { return; }
    ++summary.nodes;
    ++depth_;
    summary.maxDepth = std::max(summary.maxDepth, depth_);
    TreeWalker::walk(node);
    --depth_;
  }

 private:
  uint64_t depth_{0};
};
} // namespace

GeometrySummary computeGeometry(const Node& root) {
  GeometryWalker walker;
  root.accept(walker);
  ++walker.summary.nodes;
  walker.summary.maxDepth += 1;
  return walker.summary;
}

} // namespace pybox::ast
