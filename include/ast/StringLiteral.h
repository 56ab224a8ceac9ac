/***
 * Name: pybox::ast::StringLiteral
 * Purpose: String literal node (escapes already decoded, UTF-8).
 */
#pragma once

#include <string>
#include "ast/Literal.h"

namespace pybox::ast {
    using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;
}
