/**
 * @file
 * @brief Base of every statement node; the interpreter executes these one at a time.
 */
#pragma once

#include "ast/Node.h"

namespace pybox::ast {

struct Stmt : Node {
    using Node::Node;
};

} // namespace pybox::ast
