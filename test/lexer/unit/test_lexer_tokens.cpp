/***
 * Name: test_lexer_tokens
 * Purpose: Token kinds for keywords, operators, numbers and strings.
 */
#include <gtest/gtest.h>

#include <vector>

#include "lexer/Lexer.h"

using namespace pybox;

static std::vector<lex::TokenKind> kindsOf(const char* src) {
  lex::Lexer L; L.pushString(src, "lex.py");
  std::vector<lex::TokenKind> kinds;
  for (const auto& t : L.tokens()) { kinds.push_back(t.kind); }
  return kinds;
}

TEST(LexerTokens, SimpleAssignment) {
  using enum lex::TokenKind;
  EXPECT_EQ(kindsOf("x = 1\n"), (std::vector<lex::TokenKind>{Ident, Equal, Int, Newline, End}));
}

TEST(LexerTokens, Keywords) {
  using enum lex::TokenKind;
  EXPECT_EQ(kindsOf("async def await None True False lambda\n"),
            (std::vector<lex::TokenKind>{Async, Def, Await, NoneLit, BoolLit, BoolLit, Lambda, Newline, End}));
}

TEST(LexerTokens, CompoundOperators) {
  using enum lex::TokenKind;
  EXPECT_EQ(kindsOf("a //= b ** c -> d := e != f\n"),
            (std::vector<lex::TokenKind>{Ident, SlashSlashEqual, Ident, StarStar, Ident, Arrow, Ident, ColonEqual,
                                         Ident, NotEq, Ident, Newline, End}));
}

TEST(LexerTokens, NumberForms) {
  using enum lex::TokenKind;
  EXPECT_EQ(kindsOf("0x1F 1_000 1.5e3 .5 2j\n"), (std::vector<lex::TokenKind>{Int, Int, Float, Float, Imag, Newline, End}));
}

TEST(LexerTokens, StringPrefixes) {
  lex::Lexer L; L.pushString("'a' b'x' f'{y}' r'\\d'\n", "lex.py");
  auto toks = L.tokens();
  ASSERT_GE(toks.size(), 4u);
  EXPECT_EQ(toks[0].kind, lex::TokenKind::String);
  EXPECT_EQ(toks[1].kind, lex::TokenKind::Bytes);
  EXPECT_EQ(toks[2].kind, lex::TokenKind::String);
  EXPECT_EQ(toks[2].text, "f'{y}'");
  EXPECT_EQ(toks[3].kind, lex::TokenKind::String);
  EXPECT_EQ(toks[3].text, "r'\\d'");
}

TEST(LexerTokens, TripleQuotedStringSpansLines) {
  lex::Lexer L; L.pushString("s = \"\"\"one\ntwo\"\"\"\nt = 1\n", "lex.py");
  auto toks = L.tokens();
  ASSERT_GE(toks.size(), 4u);
  EXPECT_EQ(toks[2].kind, lex::TokenKind::String);
  EXPECT_EQ(toks[2].text, "\"\"\"one\ntwo\"\"\"");
  EXPECT_EQ(toks[2].line, 1);
  EXPECT_EQ(toks[4].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[4].line, 3);
}

TEST(LexerTokens, TokenNames) {
  EXPECT_STREQ(lex::to_string(lex::TokenKind::Def), "Def");
  EXPECT_STREQ(lex::to_string(lex::TokenKind::Newline), "Newline");
}
