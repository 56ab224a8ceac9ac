/**
 * @file
 * @brief Identifier carried by `def` and `class` statements.
 */
#pragma once

#include <string>

namespace pybox::ast {

// Entry-point lookup and the signature scan match on this name.
struct HasName {
    std::string name;
};

} // namespace pybox::ast
