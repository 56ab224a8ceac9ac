#pragma once

#include <memory>
#include "ast/Expr.h"

namespace pybox::ast {

// `lower:upper:step` inside a subscript; each part may be null.
struct Slice final : Expr {
  std::unique_ptr<Expr> lower;
  std::unique_ptr<Expr> upper;
  std::unique_ptr<Expr> step;
  Slice() : Expr(NodeKind::Slice) {}
};

} // namespace pybox::ast
