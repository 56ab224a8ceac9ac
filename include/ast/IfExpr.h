#pragma once

#include <memory>
#include "ast/Expr.h"

namespace pybox::ast {

// body if test else orelse
struct IfExpr final : Expr {
  std::unique_ptr<Expr> test;
  std::unique_ptr<Expr> body;
  std::unique_ptr<Expr> orelse;
  IfExpr() : Expr(NodeKind::IfExpr) {}
};

} // namespace pybox::ast
