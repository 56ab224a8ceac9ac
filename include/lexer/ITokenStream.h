/**
 * Name: pybox::lex::ITokenStream
 * Purpose: Lookahead token stream consumed by the parser.
 */
#pragma once

#include <cstddef>
#include "lexer/Token.h"

namespace pybox::lex {

class ITokenStream {
public:
    virtual ~ITokenStream() = default;

    virtual const Token& peek(std::size_t k = 0) = 0; // lookahead k (0=current)
    virtual Token next() = 0; // consume next token
};

} // namespace pybox::lex
