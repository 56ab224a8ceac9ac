/**
 * Name: pybox::lex::Token
 * Purpose: Token with its source text and location.
 */
#pragma once

#include <string>
#include "lexer/TokenKind.h"

namespace pybox::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // source text; for Error tokens, the message
    std::string file{};
    int line{1}; // 1-based line number
    int col{1}; // 1-based column at token start
};

} // namespace pybox::lex
