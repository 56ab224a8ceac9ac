#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Param.h"

namespace pybox::ast {

struct LambdaExpr final : Expr {
  std::vector<Param> params;
  std::unique_ptr<Expr> body;
  LambdaExpr() : Expr(NodeKind::LambdaExpr) {}
};

} // namespace pybox::ast
