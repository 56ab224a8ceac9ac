/***
 * Name: pybox::sema::findEntryPoint (impl)
 * Purpose: Breadth-first collection of async functions and entry selection.
 */
#include "sema/SignatureScan.h"

#include <deque>
#include <memory>
#include <vector>

namespace pybox::sema {

namespace {

using StmtList = std::vector<std::unique_ptr<ast::Stmt>>;

void enqueueBody(std::deque<const ast::Stmt*>& queue, const StmtList& body) {
  for (const auto& s : body) { queue.push_back(s.get()); }
}

void enqueueChildren(std::deque<const ast::Stmt*>& queue, const ast::Stmt& s) {
  switch (s.kind) {
    case ast::NodeKind::FunctionDef: enqueueBody(queue, static_cast<const ast::FunctionDef&>(s).body); break;
    case ast::NodeKind::ClassDef: enqueueBody(queue, static_cast<const ast::ClassDef&>(s).body); break;
    case ast::NodeKind::IfStmt: {
      const auto& n = static_cast<const ast::IfStmt&>(s);
      enqueueBody(queue, n.thenBody);
      enqueueBody(queue, n.elseBody);
      break;
    }
    case ast::NodeKind::WhileStmt: {
      const auto& n = static_cast<const ast::WhileStmt&>(s);
      enqueueBody(queue, n.thenBody);
      enqueueBody(queue, n.elseBody);
      break;
    }
    case ast::NodeKind::ForStmt: {
      const auto& n = static_cast<const ast::ForStmt&>(s);
      enqueueBody(queue, n.thenBody);
      enqueueBody(queue, n.elseBody);
      break;
    }
    case ast::NodeKind::WithStmt: enqueueBody(queue, static_cast<const ast::WithStmt&>(s).body); break;
    case ast::NodeKind::TryStmt: {
      const auto& n = static_cast<const ast::TryStmt&>(s);
      enqueueBody(queue, n.body);
      for (const auto& h : n.handlers) { enqueueBody(queue, h->body); }
      enqueueBody(queue, n.orelse);
      enqueueBody(queue, n.finalbody);
      break;
    }
    default:
      break;
  }
}

} // namespace

std::vector<const ast::FunctionDef*> collectAsyncFunctions(const ast::Module& mod) {
  std::vector<const ast::FunctionDef*> found;
  std::deque<const ast::Stmt*> queue;
  enqueueBody(queue, mod.body);
  while (!queue.empty()) {
    const ast::Stmt* s = queue.front();
    queue.pop_front();
    if (s->kind == ast::NodeKind::FunctionDef) {
      const auto* fn = static_cast<const ast::FunctionDef*>(s);
      if (fn->isAsync) found.push_back(fn);
    }
    enqueueChildren(queue, *s);
  }
  return found;
}

EntryPointMatch findEntryPoint(const ast::Module& mod, const std::string& entryName) {
  const auto candidates = collectAsyncFunctions(mod);
  if (candidates.empty()) return {};
  for (const auto* fn : candidates) {
    if (!entryName.empty() && fn->name != entryName) continue;
    if (fn->positionalCount() < 1) continue;
    return {true, fn->name};
  }
  return {true, candidates.front()->name};
}

} // namespace pybox::sema
