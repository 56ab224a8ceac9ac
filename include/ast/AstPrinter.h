/***
 * Name: pybox::ast::AstPrinter
 * Purpose: Render an indented, one-node-per-line dump of a syntax tree.
 * Outputs: Text such as "Module\n  ExprStmt @1:1\n    Call @1:1\n ..."
 */
#pragma once

#include <ostream>
#include <string>
#include "ast/TreeWalker.h"

namespace pybox::ast {

class AstPrinter : public TreeWalker {
 public:
  explicit AstPrinter(std::ostream& out) : out_(out) {}

  void print(const Node& root) { walk(&root); }

  static std::string describe(const Node& node);

 protected:
  void walk(const Node* node) override;

 private:
  std::ostream& out_;
  int depth_{0};
};

std::string dump(const Node& root);

} // namespace pybox::ast
