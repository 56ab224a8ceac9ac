#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    // elif chains are nested IfStmt nodes in orelse
    struct IfStmt final : Stmt {
        std::unique_ptr<Expr> cond;
        std::vector<std::unique_ptr<Stmt>> thenBody;
        std::vector<std::unique_ptr<Stmt>> elseBody;
        IfStmt() : Stmt(NodeKind::IfStmt) {}
    };
}
