#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct ExceptHandler final : Node {
        std::unique_ptr<Expr> type; // may be null (bare except)
        std::string name;           // empty if none
        std::vector<std::unique_ptr<Stmt>> body;
        ExceptHandler() : Node(NodeKind::ExceptHandler) {}
    };
}
