#pragma once

#include "ast/Expr.h"

namespace pybox::ast {
    struct EllipsisLiteral final : Expr {
        EllipsisLiteral() : Expr(NodeKind::EllipsisLiteral) {}
    };
}
