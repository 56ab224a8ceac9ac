/**
 * @file
 * @brief Assignment `a = b = value` and annotated assignment `a: T = value`.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct AssignStmt final : Stmt {
        std::vector<std::unique_ptr<Expr>> targets;
        std::unique_ptr<Expr> value; // null for a bare annotation `a: T`
        std::unique_ptr<Expr> annotation; // never evaluated
        AssignStmt() : Stmt(NodeKind::AssignStmt) {}
    };
}
