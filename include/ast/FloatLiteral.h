#pragma once

#include "ast/Literal.h"

namespace pybox::ast {
    using FloatLiteral = Literal<double, NodeKind::FloatLiteral>;
}
