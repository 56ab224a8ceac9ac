/**
 * Name: pybox::lex::TokenKind
 * Purpose: Token kinds produced by the fragment lexer.
 */
#pragma once

namespace pybox::lex {

enum class TokenKind {
    End, // EOF
    Newline, // logical line end
    Indent, // indentation increase
    Dedent, // indentation decrease
    Error, // lexical error; text carries the message

    Def, // def
    Return, // return
    Del, // del
    If, // if
    Else, // else
    Elif, // elif
    While, // while
    For, // for
    In, // in
    Break, // break
    Continue, // continue
    Pass, // pass
    Try, // try
    Except, // except
    Finally, // finally
    With, // with
    As, // as
    Import, // import
    From, // from
    Class, // class
    Async, // async
    Assert, // assert
    Raise, // raise
    Global, // global
    Nonlocal, // nonlocal
    Yield, // yield
    Await, // await
    Lambda, // lambda
    Is, // is
    And, // and
    Or, // or
    Not, // not
    NoneLit, // None
    BoolLit, // True/False

    At, // @
    Arrow, // ->
    Colon, // :
    ColonEqual, // :=
    Semicolon, // ;
    Comma, // ,
    Dot, // .
    Ellipsis, // ...
    Equal, // =
    Plus, // +
    PlusEqual, // +=
    Minus, // -
    MinusEqual, // -=
    Star, // *
    StarEqual, // *=
    StarStar, // **
    StarStarEqual, // **=
    Slash, // /
    SlashEqual, // /=
    SlashSlash, // //
    SlashSlashEqual, // //=
    Percent, // %
    PercentEqual, // %=
    LShift, // <<
    LShiftEqual, // <<=
    RShift, // >>
    RShiftEqual, // >>=
    Amp, // &
    AmpEqual, // &=
    Pipe, // |
    PipeEqual, // |=
    Caret, // ^
    CaretEqual, // ^=
    Tilde, // ~
    EqEq, // ==
    NotEq, // !=
    Lt, // <
    Le, // <=
    Gt, // >
    Ge, // >=
    LParen, // (
    RParen, // )
    LBracket, // [
    RBracket, // ]
    LBrace, // {
    RBrace, // }

    Ident, // identifier
    Int, // integer literal
    Float, // float literal
    Imag, // imaginary literal (1j)
    String, // string literal, raw text including prefix and quotes
    Bytes // bytes literal, raw text including prefix and quotes
};

// Stable name for diagnostics and token dumps
const char* to_string(TokenKind k);

} // namespace pybox::lex
