/**
 * @file
 * @brief Formatted string literal: alternating text and replacement fields.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"

namespace pybox::ast {

struct FStringLiteral;

struct FStringSegment {
  bool isExpr{false};
  std::string text; // when !isExpr
  std::unique_ptr<Expr> expr; // when isExpr
  char conversion{'\0'}; // 'r', 's', 'a' or '\0'
  std::unique_ptr<FStringLiteral> formatSpec; // optional, may itself hold fields
};

struct FStringLiteral final : Expr {
  std::vector<FStringSegment> parts;
  FStringLiteral() : Expr(NodeKind::FStringLiteral) {}
};

} // namespace pybox::ast
