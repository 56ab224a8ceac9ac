/***
 * Name: pybox::ast::Node::accept
 * Purpose: Dynamic dispatch via the central kind switch.
 */
#include "ast/Node.h"
#include "ast/Visitor.h"
#include "ast/VisitorBase.h"

namespace pybox::ast {

void Node::accept(VisitorBase& visitor) const {
    dispatch(*this, visitor);
}

} // namespace pybox::ast
