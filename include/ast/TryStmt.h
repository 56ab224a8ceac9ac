/**
 * @file
 * @brief AST try/except/else/finally declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/ExceptHandler.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct TryStmt final : Stmt {
        std::vector<std::unique_ptr<Stmt>> body;
        std::vector<std::unique_ptr<ExceptHandler>> handlers;
        std::vector<std::unique_ptr<Stmt>> orelse;
        std::vector<std::unique_ptr<Stmt>> finalbody;
        TryStmt() : Stmt(NodeKind::TryStmt) {}
    };
}
