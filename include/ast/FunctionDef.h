/**
 * @file
 * @brief `def` / `async def` statement.
 */
#pragma once

#include <utility>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasName.h"
#include "ast/Param.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct FunctionDef final : Stmt, HasBody<Stmt>, HasName {
        std::vector<Param> params;
        std::vector<std::unique_ptr<Expr>> decorators;
        std::unique_ptr<Expr> returns; // optional annotation; never evaluated
        bool isAsync{false};
        explicit FunctionDef(std::string n)
            : Stmt(NodeKind::FunctionDef), HasName{std::move(n)} {}

        // Number of parameters that can be bound positionally.
        std::size_t positionalCount() const {
            std::size_t n = 0;
            for (const auto& p : params) {
                if (p.kind == ParamKind::Positional || p.kind == ParamKind::PositionalOnly) { ++n; }
            }
            return n;
        }
    };

} // namespace pybox::ast
