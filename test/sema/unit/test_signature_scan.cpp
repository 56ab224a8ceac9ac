/***
 * Name: test_signature_scan
 * Purpose: Entry-point discovery for named fragments.
 */
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "sema/SignatureScan.h"
#include "sema/Validator.h"

using namespace pybox;
using sema::FragmentMode;
using sema::Validator;

TEST(SignatureScan, NamedEntryFound) {
  const auto r = Validator::validate(
      "async def explore_level(nh, **params):\n"
      "    return None\n",
      FragmentMode::Named, "explore_level");
  EXPECT_TRUE(r.valid);
  EXPECT_TRUE(r.signatureOk);
  ASSERT_TRUE(r.entryNameFound.has_value());
  EXPECT_EQ(*r.entryNameFound, "explore_level");
  EXPECT_EQ(r.errorKind, sema::ValidationErrorKind::None);
}

TEST(SignatureScan, SyncFunctionIsNotAnEntry) {
  const auto r = Validator::validate("def helper(nh):\n    pass\n", FragmentMode::Named, "helper");
  EXPECT_FALSE(r.valid);
  EXPECT_FALSE(r.signatureOk);
  EXPECT_EQ(r.errorKind, sema::ValidationErrorKind::MissingEntryPoint);
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0], Validator::kSignatureHint);
}

TEST(SignatureScan, AdHocSkipsSignatureCheck) {
  const auto r = Validator::validate("def helper(nh):\n    pass\n", FragmentMode::AdHoc);
  EXPECT_TRUE(r.valid);
  EXPECT_FALSE(r.signatureOk);
  EXPECT_FALSE(r.entryNameFound.has_value());
}

TEST(SignatureScan, NestedAsyncDefinitionDiscovered) {
  const auto r = Validator::validate(
      "if True:\n"
      "    async def inner(nh):\n"
      "        pass\n",
      FragmentMode::Named);
  ASSERT_TRUE(r.valid);
  EXPECT_EQ(*r.entryNameFound, "inner");
}

TEST(SignatureScan, PrefersRequestedName) {
  const char* src =
      "async def first(nh):\n"
      "    pass\n"
      "async def second(nh):\n"
      "    pass\n";
  EXPECT_EQ(*Validator::validate(src, FragmentMode::Named, "second").entryNameFound, "second");
  EXPECT_EQ(*Validator::validate(src, FragmentMode::Named, "").entryNameFound, "first");
}

TEST(SignatureScan, SkipsCandidatesWithoutHandleParameter) {
  auto mod = sema::validateSyntax(
      "async def nothing():\n"
      "    pass\n"
      "async def real(nh, **params):\n"
      "    pass\n");
  const auto match = sema::findEntryPoint(*mod, "");
  EXPECT_TRUE(match.ok);
  EXPECT_EQ(match.name, "real");
}

TEST(SignatureScan, BreadthFirstOrder) {
  auto mod = sema::validateSyntax(
      "if x:\n"
      "    async def deep(nh):\n"
      "        pass\n"
      "async def shallow(nh):\n"
      "    pass\n");
  const auto fns = sema::collectAsyncFunctions(*mod);
  ASSERT_EQ(fns.size(), 2u);
  EXPECT_EQ(fns[0]->name, "shallow");
  EXPECT_EQ(fns[1]->name, "deep");
}

TEST(SignatureScan, RepeatedValidationIsStable) {
  const char* src = "async def go(nh, **params):\n    await nh.search()\n";
  const auto a = Validator::validate(src, FragmentMode::Named, "go");
  const auto b = Validator::validate(src, FragmentMode::Named, "go");
  EXPECT_EQ(a.valid, b.valid);
  EXPECT_EQ(a.entryNameFound, b.entryNameFound);
  EXPECT_EQ(a.errors, b.errors);
  EXPECT_EQ(a.warnings, b.warnings);
  EXPECT_EQ(a.actionsReferenced, b.actionsReferenced);
}

TEST(SignatureScan, ParsedModuleHandedBack) {
  std::unique_ptr<ast::Module> parsed;
  const auto r = Validator::validate("x = 1\n", FragmentMode::AdHoc, "", parsed);
  EXPECT_TRUE(r.valid);
  ASSERT_NE(parsed, nullptr);
  EXPECT_EQ(parsed->body.size(), 1u);
}
