#pragma once

#include <utility>
#include <string>
#include "ast/Expr.h"
#include "ast/ExprContext.h"

namespace pybox::ast {
    struct Name final : Expr {
        std::string id;
        ExprContext ctx{ExprContext::Load};
        explicit Name(std::string n) : Expr(NodeKind::Name), id(std::move(n)) {}
    };
}
