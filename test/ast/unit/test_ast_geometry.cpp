/***
 * Name: test_ast_geometry
 * Purpose: Node counts and depth reported for --metrics.
 */
#include <gtest/gtest.h>

#include <memory>

#include "ast/GeometrySummary.h"
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

using namespace pybox;

static std::unique_ptr<ast::Module> parseSrc(const char* src) {
  lex::Lexer lexer;
  lexer.pushString(src, "t.py");
  parse::Parser parser(lexer);
  return parser.parseModule();
}

TEST(AstGeometry, EmptyModuleIsOneNode) {
  auto mod = parseSrc("");
  const auto g = ast::computeGeometry(*mod);
  EXPECT_EQ(g.nodes, 1u);
  EXPECT_EQ(g.maxDepth, 1u);
}

TEST(AstGeometry, CountsEveryNode) {
  auto mod = parseSrc("x = 1\n");
  const auto g = ast::computeGeometry(*mod);
  EXPECT_EQ(g.nodes, 4u);
  EXPECT_EQ(g.maxDepth, 3u);
}

TEST(AstGeometry, NestingIncreasesDepth) {
  auto flat = parseSrc("x = 1\ny = 2\n");
  auto nested = parseSrc("if a:\n    if b:\n        x = 1\n");
  EXPECT_EQ(ast::computeGeometry(*flat).maxDepth, 3u);
  EXPECT_GT(ast::computeGeometry(*nested).maxDepth, 3u);
  EXPECT_EQ(ast::computeGeometry(*flat).nodes, 7u);
}
