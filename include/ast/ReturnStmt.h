#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct ReturnStmt final : Stmt {
        std::unique_ptr<Expr> value; // null for bare return
        ReturnStmt() : Stmt(NodeKind::ReturnStmt) {}
    };
}
