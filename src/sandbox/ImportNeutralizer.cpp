/***
 * Name: pybox::sandbox::neutralizeImports (impl)
 */
#include "sandbox/ImportNeutralizer.h"

#include <memory>
#include <vector>

namespace pybox::sandbox {

namespace {

using StmtList = std::vector<std::unique_ptr<ast::Stmt>>;

std::size_t neutralize(StmtList& body) {
  std::size_t replaced = 0;
  for (auto& stmt : body) {
    switch (stmt->kind) {
      case ast::NodeKind::Import:
      case ast::NodeKind::ImportFrom: {
        auto pass = std::make_unique<ast::PassStmt>();
        pass->line = stmt->line;
        pass->col = stmt->col;
        pass->file = stmt->file;
        stmt = std::move(pass);
        ++replaced;
        break;
      }
      case ast::NodeKind::FunctionDef:
        replaced += neutralize(static_cast<ast::FunctionDef&>(*stmt).body);
        break;
      case ast::NodeKind::ClassDef:
        replaced += neutralize(static_cast<ast::ClassDef&>(*stmt).body);
        break;
      case ast::NodeKind::IfStmt: {
        auto& s = static_cast<ast::IfStmt&>(*stmt);
        replaced += neutralize(s.thenBody) + neutralize(s.elseBody);
        break;
      }
      case ast::NodeKind::WhileStmt: {
        auto& s = static_cast<ast::WhileStmt&>(*stmt);
        replaced += neutralize(s.thenBody) + neutralize(s.elseBody);
        break;
      }
      case ast::NodeKind::ForStmt: {
        auto& s = static_cast<ast::ForStmt&>(*stmt);
        replaced += neutralize(s.thenBody) + neutralize(s.elseBody);
        break;
      }
      case ast::NodeKind::TryStmt: {
        auto& s = static_cast<ast::TryStmt&>(*stmt);
        replaced += neutralize(s.body) + neutralize(s.orelse) + neutralize(s.finalbody);
        for (auto& handler : s.handlers) { replaced += neutralize(handler->body); }
        break;
      }
      case ast::NodeKind::WithStmt:
        replaced += neutralize(static_cast<ast::WithStmt&>(*stmt).body);
        break;
      default:
        break;
    }
  }
  return replaced;
}

} // namespace

std::size_t neutralizeImports(ast::Module& module) { return neutralize(module.body); }

} // namespace pybox::sandbox
