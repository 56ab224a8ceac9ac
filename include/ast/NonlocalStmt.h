#pragma once

#include <string>
#include <vector>
#include "ast/Stmt.h"

namespace pybox::ast {
    struct NonlocalStmt final : Stmt {
        std::vector<std::string> names;
        NonlocalStmt() : Stmt(NodeKind::NonlocalStmt) {}
    };
}
