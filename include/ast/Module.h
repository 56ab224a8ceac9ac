/**
 * @file
 * @brief AST module node: the whole fragment.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/HasBody.h"
#include "ast/Node.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    struct Module final : Node, HasBody<Stmt> {
        Module() : Node(NodeKind::Module) {}
    };
} // namespace pybox::ast
