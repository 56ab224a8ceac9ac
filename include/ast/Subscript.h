#pragma once

#include <utility>
#include <memory>
#include "ast/Expr.h"
#include "ast/ExprContext.h"

namespace pybox::ast {

struct Subscript final : Expr {
  std::unique_ptr<Expr> value;
  std::unique_ptr<Expr> slice; // index expression, Slice, or tuple of them
  ExprContext ctx{ExprContext::Load};
  Subscript(std::unique_ptr<Expr> v, std::unique_ptr<Expr> s)
      : Expr(NodeKind::Subscript), value(std::move(v)), slice(std::move(s)) {}
};

} // namespace pybox::ast
