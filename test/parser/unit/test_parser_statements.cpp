/***
 * Name: test_parser_statements
 * Purpose: Statement forms the sandbox relies on: assignment, async def, imports, try.
 */
#include <gtest/gtest.h>

#include <memory>
#include <string>

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

TEST(ParserStatements, SingleAndChainedAssignment) {
  auto mod = parseSrc("x = 1\na = b = 2\n");
  ASSERT_EQ(mod->body.size(), 2u);
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::AssignStmt);
  const auto& first = static_cast<const ast::AssignStmt&>(*mod->body[0]);
  ASSERT_EQ(first.targets.size(), 1u);
  EXPECT_EQ(first.targets[0]->kind, ast::NodeKind::Name);
  ASSERT_EQ(first.value->kind, ast::NodeKind::IntLiteral);
  EXPECT_EQ(static_cast<const ast::IntLiteral&>(*first.value).value, 1);
  const auto& second = static_cast<const ast::AssignStmt&>(*mod->body[1]);
  EXPECT_EQ(second.targets.size(), 2u);
  EXPECT_EQ(second.line, 2);
}

TEST(ParserStatements, AsyncFunctionWithKeywordParams) {
  auto mod = parseSrc(
      "async def walk(nh, **params):\n"
      "    await nh.move(Direction.N)\n"
      "    return 1\n");
  ASSERT_EQ(mod->body.size(), 1u);
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::FunctionDef);
  const auto& fn = static_cast<const ast::FunctionDef&>(*mod->body[0]);
  EXPECT_EQ(fn.name, "walk");
  EXPECT_TRUE(fn.isAsync);
  ASSERT_EQ(fn.params.size(), 2u);
  EXPECT_EQ(fn.params[0].name, "nh");
  EXPECT_EQ(fn.params[1].kind, ast::ParamKind::KwArgs);
  EXPECT_EQ(fn.positionalCount(), 1u);
  ASSERT_EQ(fn.body.size(), 2u);

  ASSERT_EQ(fn.body[0]->kind, ast::NodeKind::ExprStmt);
  const auto& es = static_cast<const ast::ExprStmt&>(*fn.body[0]);
  ASSERT_EQ(es.value->kind, ast::NodeKind::AwaitExpr);
  const auto& aw = static_cast<const ast::AwaitExpr&>(*es.value);
  ASSERT_EQ(aw.value->kind, ast::NodeKind::Call);
  const auto& call = static_cast<const ast::Call&>(*aw.value);
  ASSERT_EQ(call.callee->kind, ast::NodeKind::Attribute);
  EXPECT_EQ(static_cast<const ast::Attribute&>(*call.callee).attr, "move");
  EXPECT_EQ(call.args.size(), 1u);
  EXPECT_EQ(fn.body[1]->kind, ast::NodeKind::ReturnStmt);
}

TEST(ParserStatements, PlainDefIsNotAsync) {
  auto mod = parseSrc("def helper(a, b=2, *rest, key=None):\n    pass\n");
  const auto& fn = static_cast<const ast::FunctionDef&>(*mod->body[0]);
  EXPECT_FALSE(fn.isAsync);
  ASSERT_EQ(fn.params.size(), 4u);
  EXPECT_NE(fn.params[1].defaultValue, nullptr);
  EXPECT_EQ(fn.params[2].kind, ast::ParamKind::VarArgs);
  EXPECT_EQ(fn.params[3].kind, ast::ParamKind::KeywordOnly);
  EXPECT_EQ(fn.positionalCount(), 2u);
}

TEST(ParserStatements, ImportForms) {
  auto mod = parseSrc("import os.path as p, math\nfrom ..pkg import a as b\n");
  ASSERT_EQ(mod->body.size(), 2u);
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::Import);
  const auto& imp = static_cast<const ast::Import&>(*mod->body[0]);
  ASSERT_EQ(imp.names.size(), 2u);
  EXPECT_EQ(imp.names[0].name, "os.path");
  EXPECT_EQ(imp.names[0].asname, "p");
  EXPECT_EQ(imp.names[1].name, "math");
  ASSERT_EQ(mod->body[1]->kind, ast::NodeKind::ImportFrom);
  const auto& from = static_cast<const ast::ImportFrom&>(*mod->body[1]);
  EXPECT_EQ(from.module, "pkg");
  EXPECT_EQ(from.level, 2);
  ASSERT_EQ(from.names.size(), 1u);
  EXPECT_EQ(from.names[0].asname, "b");
}

TEST(ParserStatements, TryExceptElseFinally) {
  auto mod = parseSrc(
      "try:\n"
      "    x = 1\n"
      "except ValueError as e:\n"
      "    x = 2\n"
      "except:\n"
      "    x = 3\n"
      "else:\n"
      "    x = 4\n"
      "finally:\n"
      "    x = 5\n");
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::TryStmt);
  const auto& t = static_cast<const ast::TryStmt&>(*mod->body[0]);
  ASSERT_EQ(t.handlers.size(), 2u);
  EXPECT_EQ(t.handlers[0]->name, "e");
  EXPECT_NE(t.handlers[0]->type, nullptr);
  EXPECT_EQ(t.handlers[1]->type, nullptr);
  EXPECT_EQ(t.orelse.size(), 1u);
  EXPECT_EQ(t.finalbody.size(), 1u);
}

TEST(ParserStatements, WhileElseAndIfElif) {
  auto mod = parseSrc(
      "while n:\n"
      "    n -= 1\n"
      "else:\n"
      "    pass\n"
      "if a:\n"
      "    pass\n"
      "elif b:\n"
      "    pass\n");
  ASSERT_EQ(mod->body.size(), 2u);
  const auto& w = static_cast<const ast::WhileStmt&>(*mod->body[0]);
  EXPECT_EQ(w.thenBody.size(), 1u);
  EXPECT_EQ(w.elseBody.size(), 1u);
  const auto& i = static_cast<const ast::IfStmt&>(*mod->body[1]);
  ASSERT_EQ(i.elseBody.size(), 1u);
  EXPECT_EQ(i.elseBody[0]->kind, ast::NodeKind::IfStmt);
}
