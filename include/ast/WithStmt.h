#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct WithItem {
        std::unique_ptr<Expr> context;
        std::unique_ptr<Expr> target; // optional `as` target
    };

    // Parsed so the validator can walk it; the interpreter rejects it.
    struct WithStmt final : Stmt {
        std::vector<WithItem> items;
        std::vector<std::unique_ptr<Stmt>> body;
        bool isAsync{false};
        WithStmt() : Stmt(NodeKind::WithStmt) {}
    };
}
