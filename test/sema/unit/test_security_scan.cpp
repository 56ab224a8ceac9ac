/***
 * Name: test_security_scan
 * Purpose: Import, call, attribute and subscript policy through Validator.
 */
#include <gtest/gtest.h>

#include <string>

#include "sema/SecurityPolicy.h"
#include "sema/Validator.h"

using namespace pybox;
using sema::FragmentMode;
using sema::Validator;

static sema::ValidationResult adhoc(const char* src) { return Validator::validate(src, FragmentMode::AdHoc); }

TEST(SecurityPolicy, ClassifiesByFirstComponent) {
  EXPECT_EQ(sema::classifyImport("json"), sema::ImportVerdict::Allowed);
  EXPECT_EQ(sema::classifyImport("collections.abc"), sema::ImportVerdict::Allowed);
  EXPECT_EQ(sema::classifyImport("os.path"), sema::ImportVerdict::Forbidden);
  EXPECT_EQ(sema::classifyImport("subprocess"), sema::ImportVerdict::Forbidden);
  EXPECT_EQ(sema::classifyImport("numpy"), sema::ImportVerdict::Unknown);
  EXPECT_TRUE(sema::isForbiddenCall("eval"));
  EXPECT_FALSE(sema::isForbiddenCall("print"));
  EXPECT_TRUE(sema::isForbiddenAttribute("__globals__"));
  EXPECT_FALSE(sema::isForbiddenAttribute("__init__"));
}

TEST(SecurityScan, ForbiddenImportRejected) {
  const auto r = adhoc("x = 1\nimport os\n");
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.errorKind, sema::ValidationErrorKind::Security);
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0], "Security violation: Forbidden import: 'os' (line 2)");
  ASSERT_TRUE(r.violation.has_value());
  EXPECT_EQ(r.violation->category, exceptions::ViolationCategory::Import);
  EXPECT_EQ(r.violation->line, 2);
}

TEST(SecurityScan, ForbiddenFromImportRejected) {
  const auto r = adhoc("from subprocess import run\n");
  ASSERT_FALSE(r.valid);
  EXPECT_EQ(r.errors[0], "Security violation: Forbidden import: 'from subprocess' (line 1)");
}

TEST(SecurityScan, UnknownImportWarnsOnly) {
  const auto r = adhoc("import numpy\n");
  EXPECT_TRUE(r.valid);
  ASSERT_EQ(r.warnings.size(), 1u);
  EXPECT_EQ(r.warnings[0], "Unknown import: 'numpy' may not be available (line 1)");
}

TEST(SecurityScan, AllowedImportsAreQuiet) {
  const auto r = adhoc("import math\nfrom collections import deque\nimport random as rnd\n");
  EXPECT_TRUE(r.valid);
  EXPECT_TRUE(r.warnings.empty());
}

TEST(SecurityScan, WarningsKeptWhenLaterViolation) {
  const auto r = adhoc("import numpy\nimport socket\n");
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.warnings.size(), 1u);
}

TEST(SecurityScan, ForbiddenCallRejected) {
  const auto r = adhoc("y = eval('1 + 1')\n");
  ASSERT_FALSE(r.valid);
  ASSERT_TRUE(r.violation.has_value());
  EXPECT_EQ(r.violation->category, exceptions::ViolationCategory::Call);
  EXPECT_EQ(r.violation->detail, "Forbidden function call: 'eval()' (line 1)");
}

TEST(SecurityScan, ForbiddenMethodRejected) {
  const auto r = adhoc("helper.system('ls')\n");
  ASSERT_FALSE(r.valid);
  EXPECT_EQ(r.violation->category, exceptions::ViolationCategory::Call);
  EXPECT_EQ(r.violation->detail, "Forbidden method call: '.system()' (line 1)");
}

TEST(SecurityScan, DunderAttributeRejected) {
  const auto r = adhoc("t = nh.__class__\n");
  ASSERT_FALSE(r.valid);
  EXPECT_EQ(r.violation->category, exceptions::ViolationCategory::Attribute);
  EXPECT_EQ(r.violation->detail, "Forbidden attribute access: '.__class__' (line 1)");
  EXPECT_EQ(r.errors[0], "Security violation: Forbidden attribute access: '.__class__' (line 1)");
}

TEST(SecurityScan, DunderSubscriptRejected) {
  const auto r = adhoc("g = scope['__globals__']\n");
  ASSERT_FALSE(r.valid);
  EXPECT_EQ(r.violation->category, exceptions::ViolationCategory::Subscript);
  EXPECT_NE(r.violation->detail.find("__globals__"), std::string::npos);
}

TEST(SecurityScan, ViolationInsideFunctionBodyFound) {
  const auto r = Validator::validate(
      "async def sneaky(nh, **params):\n"
      "    if True:\n"
      "        return open('/etc/passwd')\n",
      FragmentMode::Named, "sneaky");
  ASSERT_FALSE(r.valid);
  EXPECT_EQ(r.violation->line, 3);
  EXPECT_FALSE(r.entryNameFound.has_value());
}

TEST(SecurityScan, ActionsReferencedInFirstUseOrder) {
  const auto r = adhoc(
      "await nh.move(Direction.N)\n"
      "await nh.search()\n"
      "await nh.move(Direction.S)\n"
      "pos = nh.get_position()\n");
  ASSERT_TRUE(r.valid);
  ASSERT_EQ(r.actionsReferenced.size(), 2u);
  EXPECT_EQ(r.actionsReferenced[0], "move");
  EXPECT_EQ(r.actionsReferenced[1], "search");
}

TEST(SecurityScan, SyntaxErrorReportedBeforeSecurity) {
  const auto r = adhoc("import os\ny = $\n");
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.errorKind, sema::ValidationErrorKind::Syntax);
  EXPECT_EQ(r.syntaxLine, 2);
  EXPECT_EQ(r.syntaxColumn, 5);
  ASSERT_EQ(r.errors.size(), 1u);
  EXPECT_EQ(r.errors[0], "Syntax error at line 2, column 5: invalid character '$'");
  EXPECT_FALSE(r.violation.has_value());
}
