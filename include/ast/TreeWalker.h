/***
 * Name: pybox::ast::TreeWalker
 * Purpose: Visitor that descends into every child of every node in source order.
 * Theory of Operation:
 *   Each visit overload walks the node's children through walk(), which
 *   re-enters the central dispatch. Subclasses override the overloads they
 *   inspect and call the TreeWalker overload to keep descending. Annotations,
 *   decorators and default values are walked as well.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

namespace pybox::ast {

class TreeWalker : public VisitorBase {
 public:
  using VisitorBase::visit;

  void visit(const Module& n) override;
  void visit(const FunctionDef& n) override;
  void visit(const ClassDef& n) override;
  void visit(const ReturnStmt& n) override;
  void visit(const AssignStmt& n) override;
  void visit(const AugAssignStmt& n) override;
  void visit(const ExprStmt& n) override;
  void visit(const IfStmt& n) override;
  void visit(const WhileStmt& n) override;
  void visit(const ForStmt& n) override;
  void visit(const TryStmt& n) override;
  void visit(const ExceptHandler& n) override;
  void visit(const WithStmt& n) override;
  void visit(const RaiseStmt& n) override;
  void visit(const AssertStmt& n) override;
  void visit(const DelStmt& n) override;
  void visit(const FStringLiteral& n) override;
  void visit(const Attribute& n) override;
  void visit(const Subscript& n) override;
  void visit(const Slice& n) override;
  void visit(const Call& n) override;
  void visit(const Binary& n) override;
  void visit(const Unary& n) override;
  void visit(const Compare& n) override;
  void visit(const IfExpr& n) override;
  void visit(const LambdaExpr& n) override;
  void visit(const NamedExpr& n) override;
  void visit(const Starred& n) override;
  void visit(const TupleLiteral& n) override;
  void visit(const ListLiteral& n) override;
  void visit(const DictLiteral& n) override;
  void visit(const SetLiteral& n) override;
  void visit(const ListComp& n) override;
  void visit(const SetComp& n) override;
  void visit(const DictComp& n) override;
  void visit(const GeneratorExpr& n) override;
  void visit(const AwaitExpr& n) override;
  void visit(const YieldExpr& n) override;

 protected:
  // Null-safe entry for a single child.
  virtual void walk(const Node* node);

  template <typename T>
  void walkAll(const std::vector<std::unique_ptr<T>>& nodes) {
    for (const auto& node : nodes) { walk(node.get()); }
  }

  void walkParams(const std::vector<Param>& params);
  void walkFors(const std::vector<ComprehensionFor>& fors);
};

} // namespace pybox::ast
