/***
 * Name: pybox::sema::SecurityScan
 * Purpose: Walk a parsed fragment and stop at the first forbidden construct.
 * Inputs:
 *   - ast::Module produced by the parser
 * Outputs:
 *   - Throws exceptions::SecurityViolation for the first violation in source order
 *   - warnings(): unknown-import warnings found before that point
 *   - actionsReferenced(): action-catalog methods called as `<x>.<action>(...)`
 * Theory of Operation:
 *   Pre-order walk; a Call is judged before its callee and arguments, so
 *   `os.system()` reports the method call rather than an attribute.
 */
#pragma once

#include <string>
#include <vector>

#include "ast/TreeWalker.h"

namespace pybox::sema {

class SecurityScan : public ast::TreeWalker {
 public:
  using ast::TreeWalker::visit;

  void run(const ast::Module& mod) { mod.accept(*this); }

  void visit(const ast::Import& n) override;
  void visit(const ast::ImportFrom& n) override;
  void visit(const ast::Call& n) override;
  void visit(const ast::Attribute& n) override;
  void visit(const ast::Subscript& n) override;

  const std::vector<std::string>& warnings() const { return warnings_; }
  const std::vector<std::string>& actionsReferenced() const { return actions_; }

 private:
  void checkModule(const std::string& shown, const std::string& module, int line);

  std::vector<std::string> warnings_;
  std::vector<std::string> actions_;
};

} // namespace pybox::sema
