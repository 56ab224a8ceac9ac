#pragma once

#include "ast/Literal.h"

namespace pybox::ast {
    // Imaginary part only; the interpreter has no complex type.
    using ImagLiteral = Literal<double, NodeKind::ImagLiteral>;
}
