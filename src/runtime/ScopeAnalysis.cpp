/***
 * Name: pybox::rt::analyzeScope
 * Purpose: Classify the names a function, lambda or comprehension binds.
 * Theory of Operation:
 *   A binding walk over the body collects every name stored, deleted,
 *   defined or caught. Nested function and lambda bodies are skipped (their
 *   defaults and decorators are evaluated here, so those are walked).
 *   Walrus targets inside a nested comprehension bind in this scope; in a
 *   comprehension's own scope they are forwarded outwards.
 */
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "ast/Nodes.h"
#include "ast/TreeWalker.h"
#include "runtime/Frame.h"

namespace pybox::rt {

namespace {

// Collects walrus targets; descends into comprehensions but not into lambdas.
class WalrusCollector : public ast::TreeWalker {
 public:
  using ast::TreeWalker::visit;
  std::unordered_set<std::string> names;

  void visit(const ast::NamedExpr& n) override {
    if (const auto* target = dynamic_cast<const ast::Name*>(n.target.get())) { names.insert(target->id); }
    walk(n.value.get());
  }
  void visit(const ast::LambdaExpr& n) override { walkParams(n.params); }

  void collect(const ast::Node* node) { walk(node); }
  void collectFors(const std::vector<ast::ComprehensionFor>& fors) { walkFors(fors); }
};

class BindingCollector : public ast::TreeWalker {
 public:
  using ast::TreeWalker::visit;

  std::unordered_set<std::string> bound;
  std::unordered_set<std::string> globals;
  std::unordered_set<std::string> nonlocals;

  template <typename T>
  void collectAll(const std::vector<std::unique_ptr<T>>& nodes) { walkAll(nodes); }
  void collect(const ast::Node* node) { walk(node); }

  void visit(const ast::Name& n) override {
    if (n.ctx != ast::ExprContext::Load) { bound.insert(n.id); }
  }
  void visit(const ast::FunctionDef& n) override {
    bound.insert(n.name);
    walkAll(n.decorators);
    for (const auto& p : n.params) { walk(p.defaultValue.get()); }
  }
  void visit(const ast::ClassDef& n) override {
    bound.insert(n.name);
    walkAll(n.decorators);
    walkAll(n.bases);
  }
  void visit(const ast::LambdaExpr& n) override {
    for (const auto& p : n.params) { walk(p.defaultValue.get()); }
  }
  void visit(const ast::AugAssignStmt& n) override {
    if (const auto* target = dynamic_cast<const ast::Name*>(n.target.get())) { bound.insert(target->id); }
    ast::TreeWalker::visit(n);
  }
  void visit(const ast::NamedExpr& n) override {
    if (const auto* target = dynamic_cast<const ast::Name*>(n.target.get())) { bound.insert(target->id); }
    walk(n.value.get());
  }
  void visit(const ast::ExceptHandler& n) override {
    if (!n.name.empty()) { bound.insert(n.name); }
    ast::TreeWalker::visit(n);
  }
  void visit(const ast::GlobalStmt& n) override { globals.insert(n.names.begin(), n.names.end()); }
  void visit(const ast::NonlocalStmt& n) override { nonlocals.insert(n.names.begin(), n.names.end()); }
  void visit(const ast::Import& n) override {
    for (const auto& a : n.names) { bound.insert(a.asname.empty() ? a.name.substr(0, a.name.find('.')) : a.asname); }
  }
  void visit(const ast::ImportFrom& n) override {
    for (const auto& a : n.names) {
      if (a.name != "*") { bound.insert(a.asname.empty() ? a.name : a.asname); }
    }
  }
  void visit(const ast::ListComp& n) override { comprehension(n.fors, n.elt.get()); }
  void visit(const ast::SetComp& n) override { comprehension(n.fors, n.elt.get()); }
  void visit(const ast::GeneratorExpr& n) override { comprehension(n.fors, n.elt.get()); }
  void visit(const ast::DictComp& n) override { comprehension(n.fors, n.key.get(), n.value.get()); }

 private:
  void comprehension(const std::vector<ast::ComprehensionFor>& fors, const ast::Node* a,
                     const ast::Node* b = nullptr) {
    WalrusCollector walrus;
    walrus.collectFors(fors);
    walrus.collect(a);
    walrus.collect(b);
    bound.insert(walrus.names.begin(), walrus.names.end());
  }
};

class TargetCollector : public ast::TreeWalker {
 public:
  using ast::TreeWalker::visit;
  std::unordered_set<std::string> names;
  void visit(const ast::Name& n) override {
    if (n.ctx != ast::ExprContext::Load) { names.insert(n.id); }
  }
  void collect(const ast::Node* node) { walk(node); }
};

std::shared_ptr<const ScopeInfo> finish(BindingCollector& c, const std::vector<ast::Param>& params) {
  auto info = std::make_shared<ScopeInfo>();
  info->locals = std::move(c.bound);
  for (const auto& p : params) { info->locals.insert(p.name); }
  for (const auto& g : c.globals) { info->locals.erase(g); }
  for (const auto& n : c.nonlocals) { info->locals.erase(n); }
  info->globals = std::move(c.globals);
  info->nonlocals = std::move(c.nonlocals);
  return info;
}

std::shared_ptr<const ScopeInfo> comprehensionScope(const std::vector<ast::ComprehensionFor>& fors,
                                                    const ast::Node* a, const ast::Node* b = nullptr) {
  auto info = std::make_shared<ScopeInfo>();
  TargetCollector targets;
  for (const auto& f : fors) { targets.collect(f.target.get()); }
  info->locals = std::move(targets.names);
  WalrusCollector walrus;
  walrus.collectFors(fors);
  walrus.collect(a);
  walrus.collect(b);
  info->forwarded = std::move(walrus.names);
  return info;
}

} // namespace

std::shared_ptr<const ScopeInfo> analyzeScope(const ast::Node& node) {
  switch (node.kind) {
    case ast::NodeKind::FunctionDef: {
      const auto& def = static_cast<const ast::FunctionDef&>(node);
      BindingCollector c;
      c.collectAll(def.body);
      return finish(c, def.params);
    }
    case ast::NodeKind::LambdaExpr: {
      const auto& lambda = static_cast<const ast::LambdaExpr&>(node);
      BindingCollector c;
      c.collect(lambda.body.get());
      return finish(c, lambda.params);
    }
    case ast::NodeKind::ListComp: {
      const auto& e = static_cast<const ast::ListComp&>(node);
      return comprehensionScope(e.fors, e.elt.get());
    }
    case ast::NodeKind::SetComp: {
      const auto& e = static_cast<const ast::SetComp&>(node);
      return comprehensionScope(e.fors, e.elt.get());
    }
    case ast::NodeKind::GeneratorExpr: {
      const auto& e = static_cast<const ast::GeneratorExpr&>(node);
      return comprehensionScope(e.fors, e.elt.get());
    }
    case ast::NodeKind::DictComp: {
      const auto& e = static_cast<const ast::DictComp&>(node);
      return comprehensionScope(e.fors, e.key.get(), e.value.get());
    }
    default: return std::make_shared<ScopeInfo>();
  }
}

} // namespace pybox::rt
