#pragma once

#include <utility>
#include <memory>
#include "ast/Expr.h"
#include "ast/ExprContext.h"

namespace pybox::ast {

// `*value` in displays, call arguments and assignment targets
struct Starred final : Expr {
  std::unique_ptr<Expr> value;
  ExprContext ctx{ExprContext::Load};
  explicit Starred(std::unique_ptr<Expr> v) : Expr(NodeKind::Starred), value(std::move(v)) {}
};

} // namespace pybox::ast
