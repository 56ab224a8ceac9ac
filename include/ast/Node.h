/**
 * @file
 * @brief AST base node declarations.
 */
#pragma once

#include "NodeKind.h"
#include <string>

namespace pybox::ast {

    struct VisitorBase; // fwd

    struct Node {
        NodeKind kind;
        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;
        Node(const Node&) = delete;
        Node& operator=(const Node&) = delete;

        // Polymorphic dispatch entrypoint (central switch in Visitor.h)
        virtual void accept(VisitorBase& v) const;

        int line{0};
        int col{0};
        std::string file{};
    };

} // namespace pybox::ast
