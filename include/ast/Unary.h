#pragma once
#include <utility>
#include <memory>

#include "ast/Expr.h"
#include "ast/UnaryOperator.h"

namespace pybox::ast {
    struct Unary final : Expr {
        UnaryOperator op;
        std::unique_ptr<Expr> operand;
        Unary(const UnaryOperator o, std::unique_ptr<Expr> e)
            : Expr(NodeKind::UnaryExpr), op(o), operand(std::move(e)) {}
    };
} // namespace pybox::ast
