#pragma once

#include <memory>
#include "ast/Expr.h"

namespace pybox::ast {
    struct YieldExpr final : Expr {
        std::unique_ptr<Expr> value; // may be null
        bool isFrom{false};
        YieldExpr() : Expr(NodeKind::YieldExpr) {}
    };
}
