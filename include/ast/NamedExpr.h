#pragma once

#include <memory>
#include "ast/Expr.h"

namespace pybox::ast {

// Assignment expression `target := value`
struct NamedExpr final : Expr {
  std::unique_ptr<Expr> target; // Name
  std::unique_ptr<Expr> value;
  NamedExpr() : Expr(NodeKind::NamedExpr) {}
};

} // namespace pybox::ast
