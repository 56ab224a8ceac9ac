/***
 * Name: test_security_tables
 * Purpose: Every entry of every policy table is enforced by the validator.
 */
#include <gtest/gtest.h>

#include <string>

#include "sema/SecurityPolicy.h"
#include "sema/Validator.h"

using namespace pybox;
using exceptions::ViolationCategory;
using sema::FragmentMode;
using sema::Validator;

static sema::ValidationResult adhoc(const std::string& src) { return Validator::validate(src, FragmentMode::AdHoc); }

static void expectRejected(const std::string& src, ViolationCategory category) {
  SCOPED_TRACE(src);
  const auto r = adhoc(src);
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.errorKind, sema::ValidationErrorKind::Security);
  ASSERT_TRUE(r.violation.has_value());
  EXPECT_EQ(r.violation->category, category);
  EXPECT_EQ(r.violation->line, 1);
}

TEST(SecurityTables, EveryDeniedModuleRejected) {
  for (const auto module : sema::kForbiddenModulePrefixes) {
    const std::string name(module);
    expectRejected("import " + name + "\n", ViolationCategory::Import);
    expectRejected("from " + name + " import thing\n", ViolationCategory::Import);
    expectRejected("import " + name + ".sub as alias\n", ViolationCategory::Import);
  }
}

TEST(SecurityTables, EveryAllowedModuleAccepted) {
  for (const auto module : sema::kAllowedImports) {
    const std::string name(module);
    for (const std::string& src : {"import " + name + "\n", "from " + name + " import thing\n"}) {
      SCOPED_TRACE(src);
      const auto r = adhoc(src);
      EXPECT_TRUE(r.valid);
      EXPECT_TRUE(r.errors.empty());
      EXPECT_TRUE(r.warnings.empty());
    }
  }
}

TEST(SecurityTables, EveryForbiddenCallRejected) {
  for (const auto call : sema::kForbiddenCalls) {
    const std::string name(call);
    expectRejected("x = " + name + "()\n", ViolationCategory::Call);
    const auto r = adhoc(name + "('a')\n");
    ASSERT_TRUE(r.violation.has_value()) << name;
    EXPECT_EQ(r.violation->detail, "Forbidden function call: '" + name + "()' (line 1)");
  }
}

TEST(SecurityTables, EveryForbiddenMethodRejected) {
  for (const auto method : sema::kForbiddenMethods) {
    const std::string name(method);
    expectRejected("helper." + name + "('ls')\n", ViolationCategory::Call);
    expectRejected("nh.thing." + name + "()\n", ViolationCategory::Call);
    const auto r = adhoc("helper." + name + "()\n");
    ASSERT_TRUE(r.violation.has_value()) << name;
    EXPECT_EQ(r.violation->detail, "Forbidden method call: '." + name + "()' (line 1)");
  }
}

TEST(SecurityTables, EveryForbiddenAttributeRejected) {
  for (const auto attribute : sema::kForbiddenAttributes) {
    const std::string name(attribute);
    expectRejected("t = nh." + name + "\n", ViolationCategory::Attribute);
    const auto r = adhoc("t = nh." + name + "\n");
    ASSERT_TRUE(r.violation.has_value()) << name;
    EXPECT_EQ(r.violation->detail, "Forbidden attribute access: '." + name + "' (line 1)");
  }
}

TEST(SecurityTables, EveryForbiddenAttributeRejectedAsSubscript) {
  for (const auto attribute : sema::kForbiddenAttributes) {
    const std::string name(attribute);
    expectRejected("t = d['" + name + "']\n", ViolationCategory::Subscript);
    expectRejected("t = d[\"" + name + "\"]\n", ViolationCategory::Subscript);
    const auto r = adhoc("t = d['" + name + "']\n");
    ASSERT_TRUE(r.violation.has_value()) << name;
    EXPECT_EQ(r.violation->detail, "Forbidden subscript access: '['" + name + "']' (line 1)");
  }
}
