#pragma once

#include "ast/Stmt.h"

namespace pybox::ast {
    struct BreakStmt final : Stmt {
        BreakStmt() : Stmt(NodeKind::BreakStmt) {}
    };
}
