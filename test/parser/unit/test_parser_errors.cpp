/***
 * Name: test_parser_errors
 * Purpose: ParseError positions and the nesting and chain caps.
 */
#include <gtest/gtest.h>

#include <string>

#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pybox/exceptions/parse_error.h"

using namespace pybox;

static exceptions::ParseError parseFailure(const std::string& src) {
  lex::Lexer lexer;
  lexer.pushString(src, "t.py");
  parse::Parser parser(lexer);
  try {
    (void)parser.parseModule();
  } catch (const exceptions::ParseError& e) {
    return e;
  }
  ADD_FAILURE() << "no ParseError for: " << src;
  return exceptions::ParseError("", 0, 0);
}

TEST(ParserErrors, LexerErrorSurfacesWithPosition) {
  const auto e = parseFailure("x = 1\ny = $\n");
  EXPECT_EQ(e.line(), 2);
  EXPECT_EQ(e.col(), 5);
  EXPECT_NE(std::string(e.what()).find("invalid character"), std::string::npos);
}

TEST(ParserErrors, UnexpectedIndent) {
  const auto e = parseFailure("x = 1\n    y = 2\n");
  EXPECT_EQ(e.line(), 2);
  EXPECT_EQ(std::string(e.what()), "unexpected indent");
}

TEST(ParserErrors, MissingColonReportsLine) {
  const auto e = parseFailure("x = 1\nif x\n    pass\n");
  EXPECT_EQ(e.line(), 2);
}

TEST(ParserErrors, InvalidAssignmentTarget) {
  const auto e = parseFailure("f() = 3\n");
  EXPECT_EQ(e.line(), 1);
}

TEST(ParserErrors, DuplicateParameter) {
  const auto e = parseFailure("def f(a, a):\n    pass\n");
  EXPECT_NE(std::string(e.what()).find("duplicate argument 'a'"), std::string::npos);
}

TEST(ParserErrors, DeepNestingIsCapped) {
  const int depth = parse::Parser::kMaxNesting + 10;
  const std::string src = "x = " + std::string(depth, '(') + "1" + std::string(depth, ')') + "\n";
  const auto e = parseFailure(src);
  EXPECT_EQ(std::string(e.what()), "too many nested parentheses or blocks");
}

TEST(ParserErrors, LongOperatorChainIsCapped) {
  std::string src = "x = 1";
  for (int i = 0; i < parse::Parser::kMaxChain + 10; ++i) { src += " + 1"; }
  const auto e = parseFailure(src + "\n");
  EXPECT_EQ(std::string(e.what()), "expression too long");
}

TEST(ParserErrors, ModerateNestingParses) {
  const std::string src = "x = " + std::string(50, '(') + "1" + std::string(50, ')') + "\n";
  lex::Lexer lexer;
  lexer.pushString(src, "t.py");
  parse::Parser parser(lexer);
  EXPECT_NO_THROW((void)parser.parseModule());
}
