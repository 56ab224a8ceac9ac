#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace pybox::ast {
    // A null key marks a `**mapping` entry whose mapping is the paired value.
    struct DictLiteral final : Expr {
        std::vector<std::unique_ptr<Expr>> keys;
        std::vector<std::unique_ptr<Expr>> values;
        DictLiteral() : Expr(NodeKind::DictLiteral) {}
    };
}
