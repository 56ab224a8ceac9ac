#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct RaiseStmt final : Stmt {
        std::unique_ptr<Expr> exc;   // null re-raises the active exception
        std::unique_ptr<Expr> cause; // `from` clause
        RaiseStmt() : Stmt(NodeKind::RaiseStmt) {}
    };
}
