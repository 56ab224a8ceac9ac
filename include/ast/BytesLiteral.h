#pragma once

#include <string>
#include "ast/Literal.h"

namespace pybox::ast {
    using BytesLiteral = Literal<std::string, NodeKind::BytesLiteral>;
}
