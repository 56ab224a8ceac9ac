#pragma once

#include <memory>
#include "ast/BinaryOperator.h"
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct AugAssignStmt final : Stmt {
        std::unique_ptr<Expr> target;
        BinaryOperator op{BinaryOperator::Add};
        std::unique_ptr<Expr> value;
        AugAssignStmt() : Stmt(NodeKind::AugAssignStmt) {}
    };
}
