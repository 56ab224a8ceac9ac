/**
 * @file
 * @brief AST expression base.
 */
#pragma once

#include "ast/Node.h"

namespace pybox::ast {
    struct Expr : Node {
        using Node::Node;
    };
} // namespace pybox::ast
