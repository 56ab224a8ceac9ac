#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct WhileStmt final : Stmt {
        std::unique_ptr<Expr> cond;
        std::vector<std::unique_ptr<Stmt>> thenBody;
        std::vector<std::unique_ptr<Stmt>> elseBody; // runs when the loop ends without break
        WhileStmt() : Stmt(NodeKind::WhileStmt) {}
    };
}
