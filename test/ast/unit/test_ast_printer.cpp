/***
 * Name: test_ast_printer
 * Purpose: Indented dump format and node descriptions.
 */
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

#include "ast/AstPrinter.h"
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

TEST(AstPrinter, DumpsAssignmentTree) {
  auto mod = parseSrc("x = 1\n");
  const std::string expected =
      "Module @1:1\n"
      "  AssignStmt @1:1\n"
      "    Name id=x @1:1\n"
      "    IntLiteral value=1 @1:5\n";
  EXPECT_EQ(ast::dump(*mod), expected);
}

TEST(AstPrinter, DescribesAsyncFunctionAndAttribute) {
  auto mod = parseSrc("async def go(nh):\n    await nh.search()\n");
  const std::string out = ast::dump(*mod);
  EXPECT_NE(out.find("FunctionDef name=go params=1 async @1:1"), std::string::npos);
  EXPECT_NE(out.find("Attribute attr=search"), std::string::npos);
  EXPECT_NE(out.find("AwaitExpr"), std::string::npos);
}

TEST(AstPrinter, DescribesImportsAndOperators) {
  auto mod = parseSrc("from .pkg import a\nimport math, json\ny = a + 2\n");
  const std::string out = ast::dump(*mod);
  EXPECT_NE(out.find("ImportFrom module=.pkg @1:1"), std::string::npos);
  EXPECT_NE(out.find("Import math json @2:1"), std::string::npos);
  EXPECT_NE(out.find("BinaryExpr op=+"), std::string::npos);
}

TEST(AstPrinter, PrintsToCallerStream) {
  auto mod = parseSrc("pass\n");
  std::ostringstream oss;
  ast::AstPrinter printer(oss);
  printer.print(*mod);
  EXPECT_EQ(oss.str(), "Module @1:1\n  PassStmt @1:1\n");
}
