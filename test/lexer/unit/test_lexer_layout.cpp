/***
 * Name: test_lexer_layout
 * Purpose: Indentation, blank/comment lines, bracket joining and CRLF input.
 */
#include <gtest/gtest.h>

#include <vector>

#include "lexer/Lexer.h"

using namespace pybox;

static std::vector<lex::Token> lexAll(const char* src) {
  lex::Lexer L; L.pushString(src, "layout.py");
  return L.tokens();
}

static std::vector<lex::TokenKind> kinds(const std::vector<lex::Token>& toks) {
  std::vector<lex::TokenKind> out;
  for (const auto& t : toks) { out.push_back(t.kind); }
  return out;
}

TEST(LexerLayout, IndentAndDedent) {
  using enum lex::TokenKind;
  auto toks = lexAll("if x:\n    y = 1\nz = 2\n");
  EXPECT_EQ(kinds(toks), (std::vector<lex::TokenKind>{If, Ident, Colon, Newline, Indent, Ident, Equal, Int, Newline,
                                                      Dedent, Ident, Equal, Int, Newline, End}));
}

TEST(LexerLayout, DedentsClosedAtEof) {
  auto toks = lexAll("def f():\n  if x:\n    return 1\n");
  int indents = 0, dedents = 0;
  for (const auto& t : toks) {
    if (t.kind == lex::TokenKind::Indent) ++indents;
    if (t.kind == lex::TokenKind::Dedent) ++dedents;
  }
  EXPECT_EQ(indents, 2);
  EXPECT_EQ(dedents, 2);
  EXPECT_EQ(toks.back().kind, lex::TokenKind::End);
}

TEST(LexerLayout, CommentsAndBlankLinesProduceNoTokens) {
  auto toks = lexAll("# just a comment\n\n   \nx = 1  # trailing\n");
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks[0].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[0].line, 4);
}

TEST(LexerLayout, BracketsJoinPhysicalLines) {
  auto toks = lexAll("f(1,\n      2)\ng()\n");
  int newlines = 0;
  for (const auto& t : toks) {
    if (t.kind == lex::TokenKind::Newline) ++newlines;
    EXPECT_NE(t.kind, lex::TokenKind::Indent);
  }
  EXPECT_EQ(newlines, 2);
}

TEST(LexerLayout, BackslashContinuation) {
  auto toks = lexAll("x = 1 + \\\n    2\n");
  int newlines = 0;
  for (const auto& t : toks) { if (t.kind == lex::TokenKind::Newline) ++newlines; }
  EXPECT_EQ(newlines, 1);
}

TEST(LexerLayout, CrlfMatchesLf) {
  EXPECT_EQ(kinds(lexAll("x = 1\r\ny = 2\r\n")), kinds(lexAll("x = 1\ny = 2\n")));
}

TEST(LexerLayout, PeekDoesNotConsume) {
  lex::Lexer L; L.pushString("a b\n", "peek.py");
  EXPECT_EQ(L.peek(0).text, "a");
  EXPECT_EQ(L.peek(1).text, "b");
  EXPECT_EQ(L.next().text, "a");
  EXPECT_EQ(L.next().text, "b");
  EXPECT_EQ(L.next().kind, lex::TokenKind::Newline);
  EXPECT_EQ(L.next().kind, lex::TokenKind::End);
  EXPECT_EQ(L.next().kind, lex::TokenKind::End);
}
