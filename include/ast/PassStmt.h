#pragma once

#include "ast/Stmt.h"

namespace pybox::ast {
    struct PassStmt final : Stmt {
        PassStmt() : Stmt(NodeKind::PassStmt) {}
    };
}
