#pragma once

#include "ast/Literal.h"

namespace pybox::ast {
    using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;
}
