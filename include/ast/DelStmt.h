#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct DelStmt final : Stmt {
        std::vector<std::unique_ptr<Expr>> targets;
        DelStmt() : Stmt(NodeKind::DelStmt) {}
    };
}
