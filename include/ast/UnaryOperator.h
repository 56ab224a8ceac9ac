#pragma once

namespace pybox::ast {

enum class UnaryOperator { Neg, Pos, Invert, Not };

} // namespace pybox::ast
