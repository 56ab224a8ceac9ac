#pragma once

#include <memory>
#include "ast/Expr.h"

namespace pybox::ast {
    struct AwaitExpr final : Expr {
        std::unique_ptr<Expr> value;
        AwaitExpr() : Expr(NodeKind::AwaitExpr) {}
    };
}
