#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct ForStmt final : Stmt {
        std::unique_ptr<Expr> target;
        std::unique_ptr<Expr> iterable;
        std::vector<std::unique_ptr<Stmt>> thenBody;
        std::vector<std::unique_ptr<Stmt>> elseBody;
        bool isAsync{false};
        ForStmt() : Stmt(NodeKind::ForStmt) {}
    };
}
