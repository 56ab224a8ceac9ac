/**
 * @file
 * @brief Statement suite owned by a module, a function or a class.
 */
#pragma once

#include <memory>
#include <vector>

namespace pybox::ast {

// Statements in source order; never null entries.
template <typename StmtT>
struct HasBody {
    std::vector<std::unique_ptr<StmtT>> body;
};

} // namespace pybox::ast
