/**
 * Name: pybox::lex::Lexer
 * Purpose: Tokenize a stack of input sources (LIFO) into one token vector.
 * Theory of Operation:
 *   Lines are pulled from the source one at a time. Indentation is measured
 *   only at the start of a logical line; inside brackets or after a trailing
 *   backslash the next physical line continues the current logical line.
 *   Triple-quoted strings pull further physical lines until they close.
 *   The first lexical error becomes an Error token and ends that source.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "lexer/ITokenStream.h"
#include "lexer/InputSource.h"

namespace pybox::lex {

class Lexer : public ITokenStream {
public:
    Lexer() = default;

    void pushFile(const std::string& path);

    void pushString(const std::string& text, const std::string& name);

    // ITokenStream
    const Token& peek(std::size_t lookahead = 0) override;

    Token next() override;

    std::vector<Token> tokens();

private:
    bool finalized_{false};
    std::vector<Token> tokens_{};
    std::size_t pos_{0};

    struct State {
        std::unique_ptr<InputSource> src;
        std::string line;
        std::size_t index{0};
        int lineNo{0};
        std::vector<std::size_t> indentStack{0};
        int bracketDepth{0};
        bool continuation{false}; // trailing backslash seen
        bool failed{false};
    };

    std::vector<State> stack_{}; // LIFO of inputs

    void push(std::unique_ptr<InputSource> src);
    bool readNextLine(State& state);
    bool scanIndent(State& state); // false when the line carries no tokens
    Token scanOne(State& state);
    Token scanString(State& state, std::size_t start, std::size_t quotePos, bool isBytes);
    Token scanNumber(State& state);
    Token makeError(const State& state, std::size_t col, std::string message) const;
    void lexSource(State& state);
    void buildAll();
};

} // namespace pybox::lex
