#pragma once

#include <utility>
#include <memory>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct ExprStmt final : Stmt {
        std::unique_ptr<Expr> value;
        explicit ExprStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ExprStmt), value(std::move(v)) {}
    };
}
