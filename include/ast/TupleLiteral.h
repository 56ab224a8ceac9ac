#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/ExprContext.h"

namespace pybox::ast {
    struct TupleLiteral final : Expr {
        std::vector<std::unique_ptr<Expr>> elements;
        ExprContext ctx{ExprContext::Load};
        TupleLiteral() : Expr(NodeKind::TupleLiteral) {}
    };
}
