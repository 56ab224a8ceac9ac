#pragma once

#include "ast/Stmt.h"

namespace pybox::ast {
    struct ContinueStmt final : Stmt {
        ContinueStmt() : Stmt(NodeKind::ContinueStmt) {}
    };
}
