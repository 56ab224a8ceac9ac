/***
 * Name: test_lexer_errors
 * Purpose: The first lexical error becomes an Error token carrying its message.
 */
#include <gtest/gtest.h>

#include <string>

#include "lexer/Lexer.h"

using namespace pybox;

static lex::Token firstError(const char* src) {
  lex::Lexer L; L.pushString(src, "err.py");
  for (const auto& t : L.tokens()) {
    if (t.kind == lex::TokenKind::Error) { return t; }
  }
  return {};
}

TEST(LexerErrors, InvalidCharacter) {
  auto err = firstError("x = $\n");
  EXPECT_EQ(err.kind, lex::TokenKind::Error);
  EXPECT_EQ(err.text, "invalid character '$'");
  EXPECT_EQ(err.line, 1);
  EXPECT_EQ(err.col, 5);
}

TEST(LexerErrors, UnterminatedString) {
  auto err = firstError("x = 'abc\n");
  EXPECT_EQ(err.kind, lex::TokenKind::Error);
  EXPECT_EQ(err.text, "unterminated string literal");
}

TEST(LexerErrors, UnterminatedTripleQuotedString) {
  auto err = firstError("x = '''abc\nmore\n");
  EXPECT_EQ(err.kind, lex::TokenKind::Error);
  EXPECT_EQ(err.text, "unterminated triple-quoted string literal");
  EXPECT_EQ(err.line, 1);
}

TEST(LexerErrors, UnmatchedCloser) {
  auto err = firstError("x = 1)\n");
  EXPECT_EQ(err.kind, lex::TokenKind::Error);
  EXPECT_EQ(err.text, "unmatched ')'");
}

TEST(LexerErrors, InconsistentDedent) {
  auto err = firstError("if x:\n    a = 1\n  b = 2\n");
  EXPECT_EQ(err.kind, lex::TokenKind::Error);
  EXPECT_EQ(err.text, "unindent does not match any outer indentation level");
  EXPECT_EQ(err.line, 3);
}

TEST(LexerErrors, OpenBracketAtEof) {
  auto err = firstError("f(1,\n");
  EXPECT_EQ(err.kind, lex::TokenKind::Error);
  EXPECT_EQ(err.text, "unexpected EOF while scanning a continued line");
}

TEST(LexerErrors, MissingFileThrows) {
  lex::Lexer L;
  EXPECT_THROW(L.pushFile("/nonexistent/pybox/fragment.py"), std::exception);
}
