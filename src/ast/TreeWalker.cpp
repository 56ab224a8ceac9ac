/***
 * Name: pybox::ast::TreeWalker
 * Purpose: Child traversal for every node kind, in source order.
 */
#include "ast/TreeWalker.h"

namespace pybox::ast {

void TreeWalker::walk(const Node* node) {
  if (node != nullptr) { node->accept(*this); }
}

void TreeWalker::walkParams(const std::vector<Param>& params) {
  for (const auto& p : params) {
    walk(p.annotation.get());
    walk(p.defaultValue.get());
  }
}

void TreeWalker::walkFors(const std::vector<ComprehensionFor>& fors) {
  for (const auto& f : fors) {
    walk(f.target.get());
    walk(f.iter.get());
    walkAll(f.ifs);
  }
}

void TreeWalker::visit(const Module& n) { walkAll(n.body); }

void TreeWalker::visit(const FunctionDef& n) {
  walkAll(n.decorators);
  walkParams(n.params);
  walk(n.returns.get());
  walkAll(n.body);
}

void TreeWalker::visit(const ClassDef& n) {
  walkAll(n.decorators);
  walkAll(n.bases);
  for (const auto& kw : n.keywords) { walk(kw.value.get()); }
  walkAll(n.body);
}

void TreeWalker::visit(const ReturnStmt& n) { walk(n.value.get()); }

void TreeWalker::visit(const AssignStmt& n) {
  walkAll(n.targets);
  walk(n.annotation.get());
  walk(n.value.get());
}

void TreeWalker::visit(const AugAssignStmt& n) {
  walk(n.target.get());
  walk(n.value.get());
}

void TreeWalker::visit(const ExprStmt& n) { walk(n.value.get()); }

void TreeWalker::visit(const IfStmt& n) {
  walk(n.cond.get());
  walkAll(n.thenBody);
  walkAll(n.elseBody);
}

void TreeWalker::visit(const WhileStmt& n) {
  walk(n.cond.get());
  walkAll(n.thenBody);
  walkAll(n.elseBody);
}

void TreeWalker::visit(const ForStmt& n) {
  walk(n.target.get());
  walk(n.iterable.get());
  walkAll(n.thenBody);
  walkAll(n.elseBody);
}

void TreeWalker::visit(const TryStmt& n) {
  walkAll(n.body);
  walkAll(n.handlers);
  walkAll(n.orelse);
  walkAll(n.finalbody);
}

void TreeWalker::visit(const ExceptHandler& n) {
  walk(n.type.get());
  walkAll(n.body);
}

void TreeWalker::visit(const WithStmt& n) {
  for (const auto& item : n.items) {
    walk(item.context.get());
    walk(item.target.get());
  }
  walkAll(n.body);
}

void TreeWalker::visit(const RaiseStmt& n) {
  walk(n.exc.get());
  walk(n.cause.get());
}

void TreeWalker::visit(const AssertStmt& n) {
  walk(n.test.get());
  walk(n.msg.get());
}

void TreeWalker::visit(const DelStmt& n) { walkAll(n.targets); }

void TreeWalker::visit(const FStringLiteral& n) {
  for (const auto& part : n.parts) {
    if (!part.isExpr) { continue; }
    walk(part.expr.get());
    walk(part.formatSpec.get());
  }
}

void TreeWalker::visit(const Attribute& n) { walk(n.value.get()); }

void TreeWalker::visit(const Subscript& n) {
  walk(n.value.get());
  walk(n.slice.get());
}

void TreeWalker::visit(const Slice& n) {
  walk(n.lower.get());
  walk(n.upper.get());
  walk(n.step.get());
}

void TreeWalker::visit(const Call& n) {
  walk(n.callee.get());
  walkAll(n.args);
  for (const auto& kw : n.keywords) { walk(kw.value.get()); }
}

void TreeWalker::visit(const Binary& n) {
  walk(n.lhs.get());
  walk(n.rhs.get());
}

void TreeWalker::visit(const Unary& n) { walk(n.operand.get()); }

void TreeWalker::visit(const Compare& n) {
  walk(n.left.get());
  walkAll(n.comparators);
}

void TreeWalker::visit(const IfExpr& n) {
  walk(n.body.get());
  walk(n.test.get());
  walk(n.orelse.get());
}

void TreeWalker::visit(const LambdaExpr& n) {
  walkParams(n.params);
  walk(n.body.get());
}

void TreeWalker::visit(const NamedExpr& n) {
  walk(n.target.get());
  walk(n.value.get());
}

void TreeWalker::visit(const Starred& n) { walk(n.value.get()); }
void TreeWalker::visit(const TupleLiteral& n) { walkAll(n.elements); }
void TreeWalker::visit(const ListLiteral& n) { walkAll(n.elements); }

void TreeWalker::visit(const DictLiteral& n) {
  for (std::size_t i = 0; i < n.values.size(); ++i) {
    walk(n.keys[i].get());
    walk(n.values[i].get());
  }
}

void TreeWalker::visit(const SetLiteral& n) { walkAll(n.elements); }

void TreeWalker::visit(const ListComp& n) {
  walk(n.elt.get());
  walkFors(n.fors);
}

void TreeWalker::visit(const SetComp& n) {
  walk(n.elt.get());
  walkFors(n.fors);
}

void TreeWalker::visit(const DictComp& n) {
  walk(n.key.get());
  walk(n.value.get());
  walkFors(n.fors);
}

void TreeWalker::visit(const GeneratorExpr& n) {
  walk(n.elt.get());
  walkFors(n.fors);
}

void TreeWalker::visit(const AwaitExpr& n) { walk(n.value.get()); }
void TreeWalker::visit(const YieldExpr& n) { walk(n.value.get()); }

} // namespace pybox::ast
