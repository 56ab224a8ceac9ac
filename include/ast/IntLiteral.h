#pragma once

#include "ast/Literal.h"

namespace pybox::ast {
    using IntLiteral = Literal<long long, NodeKind::IntLiteral>;
}
