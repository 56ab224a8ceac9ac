#pragma once
#include <utility>
#include <memory>
#include <string>
#include <vector>

#include "ast/Expr.h"

namespace pybox::ast {
    // name is empty for `**mapping` arguments
    struct KeywordArg { std::string name; std::unique_ptr<Expr> value; };

    struct Call final : Expr {
        std::unique_ptr<Expr> callee;
        std::vector<std::unique_ptr<Expr>> args; // positional; Starred for *iterable
        std::vector<KeywordArg> keywords;
        explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace pybox::ast
