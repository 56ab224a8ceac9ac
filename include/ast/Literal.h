/***
 * Name: pybox::ast::Literal
 * Purpose: Scalar literal node parameterized by payload type and kind.
 */
#pragma once

#include <utility>
#include "ast/Expr.h"

namespace pybox::ast {

template <typename T, NodeKind K>
struct Literal final : Expr {
    T value;
    explicit Literal(T v) : Expr(K), value(std::move(v)) {}
};

} // namespace pybox::ast
