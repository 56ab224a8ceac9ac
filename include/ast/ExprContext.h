#pragma once

namespace pybox::ast {

// How a name/attribute/subscript expression is used.
enum class ExprContext { Load, Store, Del };

} // namespace pybox::ast
