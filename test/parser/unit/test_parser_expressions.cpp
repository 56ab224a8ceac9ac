/***
 * Name: test_parser_expressions
 * Purpose: Precedence, comparisons, f-strings and subscripts.
 */
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

using namespace pybox;

static std::unique_ptr<ast::Module> parseSrc(const std::string& src) {
  lex::Lexer lexer;
  lexer.pushString(src, "t.py");
  parse::Parser parser(lexer);
  return parser.parseModule();
}

static const ast::Expr& valueOf(const ast::Module& mod, std::size_t i = 0) {
  return *static_cast<const ast::AssignStmt&>(*mod.body[i]).value;
}

TEST(ParserExpressions, MultiplicationBindsTighter) {
  auto mod = parseSrc("x = 1 + 2 * 3\n");
  const auto& e = valueOf(*mod);
  ASSERT_EQ(e.kind, ast::NodeKind::BinaryExpr);
  const auto& add = static_cast<const ast::Binary&>(e);
  EXPECT_EQ(add.op, ast::BinaryOperator::Add);
  ASSERT_EQ(add.rhs->kind, ast::NodeKind::BinaryExpr);
  EXPECT_EQ(static_cast<const ast::Binary&>(*add.rhs).op, ast::BinaryOperator::Mul);
}

TEST(ParserExpressions, PowerIsRightAssociative) {
  auto mod = parseSrc("x = 2 ** 3 ** 2\n");
  const auto& pow = static_cast<const ast::Binary&>(valueOf(*mod));
  EXPECT_EQ(pow.op, ast::BinaryOperator::Pow);
  EXPECT_EQ(pow.lhs->kind, ast::NodeKind::IntLiteral);
  EXPECT_EQ(pow.rhs->kind, ast::NodeKind::BinaryExpr);
}

TEST(ParserExpressions, ChainedComparison) {
  auto mod = parseSrc("ok = a < b <= c\n");
  const auto& e = valueOf(*mod);
  ASSERT_EQ(e.kind, ast::NodeKind::Compare);
  const auto& cmp = static_cast<const ast::Compare&>(e);
  ASSERT_EQ(cmp.ops.size(), 2u);
  EXPECT_EQ(cmp.ops[0], ast::BinaryOperator::Lt);
  EXPECT_EQ(cmp.ops[1], ast::BinaryOperator::Le);
  EXPECT_EQ(cmp.comparators.size(), 2u);
}

TEST(ParserExpressions, FStringSplitsTextAndFields) {
  auto mod = parseSrc("s = f\"hp={hp} of {max_hp!r}\"\n");
  const auto& e = valueOf(*mod);
  ASSERT_EQ(e.kind, ast::NodeKind::FStringLiteral);
  const auto& f = static_cast<const ast::FStringLiteral&>(e);
  ASSERT_EQ(f.parts.size(), 4u);
  EXPECT_FALSE(f.parts[0].isExpr);
  EXPECT_EQ(f.parts[0].text, "hp=");
  ASSERT_TRUE(f.parts[1].isExpr);
  ASSERT_EQ(f.parts[1].expr->kind, ast::NodeKind::Name);
  EXPECT_EQ(static_cast<const ast::Name&>(*f.parts[1].expr).id, "hp");
  EXPECT_EQ(f.parts[2].text, " of ");
  EXPECT_EQ(f.parts[3].conversion, 'r');
}

TEST(ParserExpressions, FStringFormatSpec) {
  auto mod = parseSrc("s = f'{ratio:.2f}'\n");
  const auto& f = static_cast<const ast::FStringLiteral&>(valueOf(*mod));
  ASSERT_EQ(f.parts.size(), 1u);
  ASSERT_NE(f.parts[0].formatSpec, nullptr);
  ASSERT_EQ(f.parts[0].formatSpec->parts.size(), 1u);
  EXPECT_EQ(f.parts[0].formatSpec->parts[0].text, ".2f");
}

TEST(ParserExpressions, AdjacentStringsConcatenate) {
  auto mod = parseSrc("s = 'ab' \"cd\"\n");
  const auto& e = valueOf(*mod);
  ASSERT_EQ(e.kind, ast::NodeKind::StringLiteral);
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(e).value, "abcd");
}

TEST(ParserExpressions, StringSubscriptKeepsLiteralSlice) {
  auto mod = parseSrc("x = d['key']\n");
  const auto& e = valueOf(*mod);
  ASSERT_EQ(e.kind, ast::NodeKind::Subscript);
  const auto& sub = static_cast<const ast::Subscript&>(e);
  ASSERT_EQ(sub.slice->kind, ast::NodeKind::StringLiteral);
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(*sub.slice).value, "key");
}

TEST(ParserExpressions, CallWithKeywordArguments) {
  auto mod = parseSrc("r = nh.autoexplore(max_steps=50)\n");
  const auto& call = static_cast<const ast::Call&>(valueOf(*mod));
  EXPECT_TRUE(call.args.empty());
  ASSERT_EQ(call.keywords.size(), 1u);
  EXPECT_EQ(call.keywords[0].name, "max_steps");
}

TEST(ParserExpressions, ContainerDisplays) {
  auto mod = parseSrc("a = [1, 2, 3]\nb = {'k': 1, 'j': 2}\n");
  const auto& list = static_cast<const ast::ListLiteral&>(valueOf(*mod, 0));
  EXPECT_EQ(list.elements.size(), 3u);
  const auto& dict = static_cast<const ast::DictLiteral&>(valueOf(*mod, 1));
  EXPECT_EQ(dict.keys.size(), 2u);
  EXPECT_EQ(dict.values.size(), 2u);
}
