/***
 * Name: test_import_neutralizer
 * Purpose: Import statements replaced by pass at every nesting level; ad-hoc wrapping.
 */
#include <gtest/gtest.h>

#include <memory>

#include "ast/Nodes.h"
#include "sandbox/ImportNeutralizer.h"
#include "sandbox/NamespaceBuilder.h"
#include "sandbox/Sandbox.h"
#include "sema/Validator.h"

using namespace pybox;

TEST(ImportNeutralizer, ReplacesTopLevelAndNestedImports) {
  auto mod = sema::validateSyntax(
      "import math\n"
      "x = 1\n"
      "async def run(nh):\n"
      "    from random import choice\n"
      "    if x:\n"
      "        import json\n"
      "    return 1\n");
  EXPECT_EQ(sandbox::neutralizeImports(*mod), 3u);
  EXPECT_EQ(mod->body[0]->kind, ast::NodeKind::PassStmt);
  EXPECT_EQ(mod->body[0]->line, 1);
  EXPECT_EQ(mod->body[1]->kind, ast::NodeKind::AssignStmt);
  const auto& fn = static_cast<const ast::FunctionDef&>(*mod->body[2]);
  EXPECT_EQ(fn.body[0]->kind, ast::NodeKind::PassStmt);
  const auto& branch = static_cast<const ast::IfStmt&>(*fn.body[1]);
  EXPECT_EQ(branch.thenBody[0]->kind, ast::NodeKind::PassStmt);
}

TEST(ImportNeutralizer, NoImportsNoChange) {
  auto mod = sema::validateSyntax("x = 1\n");
  EXPECT_EQ(sandbox::neutralizeImports(*mod), 0u);
  EXPECT_EQ(mod->body[0]->kind, ast::NodeKind::AssignStmt);
}

TEST(WrapAdHoc, MovesStatementsIntoAsyncWrapper) {
  auto wrapped = sandbox::wrapAdHoc(sema::validateSyntax("x = 1\ny = x + 1\n"));
  ASSERT_EQ(wrapped->body.size(), 1u);
  ASSERT_EQ(wrapped->body[0]->kind, ast::NodeKind::FunctionDef);
  const auto& fn = static_cast<const ast::FunctionDef&>(*wrapped->body[0]);
  EXPECT_EQ(fn.name, sandbox::kAdHocEntry);
  EXPECT_TRUE(fn.isAsync);
  ASSERT_EQ(fn.params.size(), 1u);
  EXPECT_EQ(fn.params[0].name, sandbox::kHandleName);
  EXPECT_EQ(fn.body.size(), 2u);
}

TEST(WrapAdHoc, EmptyFragmentGetsPass) {
  auto wrapped = sandbox::wrapAdHoc(sema::validateSyntax("# nothing\n"));
  const auto& fn = static_cast<const ast::FunctionDef&>(*wrapped->body[0]);
  ASSERT_EQ(fn.body.size(), 1u);
  EXPECT_EQ(fn.body[0]->kind, ast::NodeKind::PassStmt);
}
