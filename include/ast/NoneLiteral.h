#pragma once

#include "ast/Expr.h"

namespace pybox::ast {
    struct NoneLiteral final : Expr {
        NoneLiteral() : Expr(NodeKind::NoneLiteral) {}
    };
}
