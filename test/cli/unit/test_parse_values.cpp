/***
 * Name: test_parse_values
 * Purpose: Value parsers behind --param, --mode and --timeout.
 */
#include <gtest/gtest.h>

#include <string>

#include "cli/ParseArgsInternals.h"
#include "pybox/exceptions/config_error.h"

using namespace pybox::cli::detail;

TEST(CLI_ParseValues, ParamLiterals) {
  EXPECT_TRUE(parseParamValue("None").isNone());
  EXPECT_TRUE(parseParamValue("null").isNone());
  EXPECT_FALSE(parseParamValue("false").asBool());
  EXPECT_EQ(parseParamValue("-12").asInt(), -12);
  EXPECT_DOUBLE_EQ(parseParamValue("0.75").asFloat(), 0.75);
  EXPECT_EQ(parseParamValue("\"42\"").asString(), "42");
  EXPECT_EQ(parseParamValue("north").asString(), "north");
  EXPECT_EQ(parseParamValue("").asString(), "");
}

TEST(CLI_ParseValues, ModeNames) {
  EXPECT_EQ(parseModeValue("named"), pybox::sema::FragmentMode::Named);
  EXPECT_EQ(parseModeValue("adhoc"), pybox::sema::FragmentMode::AdHoc);
  EXPECT_EQ(parseModeValue("ad-hoc"), pybox::sema::FragmentMode::AdHoc);
  EXPECT_THROW(parseModeValue("Named"), pybox::exceptions::ConfigError);
}

TEST(CLI_ParseValues, TimeoutMustBePositive) {
  EXPECT_DOUBLE_EQ(parseTimeoutValue("0.5", "--timeout"), 0.5);
  EXPECT_THROW(parseTimeoutValue("", "--timeout"), pybox::exceptions::ConfigError);
  EXPECT_THROW(parseTimeoutValue("-1", "--timeout"), pybox::exceptions::ConfigError);
  EXPECT_THROW(parseTimeoutValue("5s", "--timeout"), pybox::exceptions::ConfigError);
  try {
    parseTimeoutValue("inf", "PYBOX_TIMEOUT");
    FAIL() << "expected ConfigError";
  } catch (const pybox::exceptions::ConfigError& e) {
    EXPECT_EQ(std::string(e.what()), "PYBOX_TIMEOUT: expected a positive number of seconds, got 'inf'");
  }
}

TEST(CLI_ParseValues, UnknownOptionShape) {
  EXPECT_TRUE(isUnknownOptionArg("--frobnicate"));
  EXPECT_TRUE(isUnknownOptionArg("-x"));
  EXPECT_FALSE(isUnknownOptionArg("-"));
  EXPECT_FALSE(isUnknownOptionArg("skill.py"));
}

TEST(CLI_ParseValues, FlagAliases) {
  EXPECT_TRUE(isFlag("-h", "--help", "-h"));
  EXPECT_TRUE(isFlag("--help", "--help", "-h"));
  EXPECT_FALSE(isFlag("--helpme", "--help", "-h"));
  EXPECT_FALSE(isFlag("", "--json"));
}
