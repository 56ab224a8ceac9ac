/***
 * Name: test_parseargs
 * Purpose: Happy and sad paths of pybox argument parsing.
 */
#include <gtest/gtest.h>

#include "cli/Options.h"
#include "cli/ParseArgs.h"
#include "pybox/exceptions/config_error.h"

using namespace pybox::cli;

TEST(CLI_ParseArgs, DefaultsWithSingleInput) {
  const char* argv[] = {"pybox", "skill.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(2, const_cast<char**>(argv), o));
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "skill.py");
  EXPECT_EQ(o.mode, pybox::sema::FragmentMode::AdHoc);
  EXPECT_FALSE(o.validateOnly);
  EXPECT_FALSE(o.timeoutSeconds.has_value());
  EXPECT_EQ(o.logPath, ".");
}

TEST(CLI_ParseArgs, BoolFlags) {
  const char* argv[] = {"pybox", "--validate-only", "--json", "--verbose", "--log-lexer", "--log-ast", "-h", "f.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(8, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.validateOnly);
  EXPECT_TRUE(o.json);
  EXPECT_TRUE(o.verbose);
  EXPECT_TRUE(o.logLexer);
  EXPECT_TRUE(o.logAst);
  EXPECT_TRUE(o.showHelp);
}

TEST(CLI_ParseArgs, PrefixedOptions) {
  const char* argv[] = {"pybox", "--mode=named", "--entry=gather", "--timeout=2.5", "--seed=7", "--log-path=logs", "f.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(7, const_cast<char**>(argv), o));
  EXPECT_EQ(o.mode, pybox::sema::FragmentMode::Named);
  EXPECT_EQ(o.entry, "gather");
  ASSERT_TRUE(o.timeoutSeconds.has_value());
  EXPECT_DOUBLE_EQ(*o.timeoutSeconds, 2.5);
  ASSERT_TRUE(o.seed.has_value());
  EXPECT_EQ(*o.seed, 7u);
  EXPECT_EQ(o.logPath, "logs");
}

TEST(CLI_ParseArgs, ParamsKeepOrderAndType) {
  const char* argv[] = {"pybox", "--param=steps=5", "--param=greedy=True", "--param=label='hi there'", "f.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(5, const_cast<char**>(argv), o));
  ASSERT_EQ(o.params.size(), 3u);
  EXPECT_EQ(o.params[0].first, "steps");
  EXPECT_TRUE(o.params[0].second.isInt());
  EXPECT_EQ(o.params[0].second.asInt(), 5);
  EXPECT_EQ(o.params[1].first, "greedy");
  EXPECT_TRUE(o.params[1].second.isBool());
  EXPECT_EQ(o.params[2].second.asString(), "hi there");
}

TEST(CLI_ParseArgs, EndOfOptionsTakesDashedInput) {
  const char* argv[] = {"pybox", "--", "-odd.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv), o));
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "-odd.py");
}

TEST(CLI_ParseArgs, UnknownOptionFails) {
  const char* argv[] = {"pybox", "--unknown", "f.py"};
  Options o;
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
}

TEST(CLI_ParseArgs, MetricsFlagsConflict) {
  const char* argv[] = {"pybox", "--metrics", "--metrics-json", "f.py"};
  Options o;
  EXPECT_FALSE(ParseArgs(4, const_cast<char**>(argv), o));
}

TEST(CLI_ParseArgs, BadValuesThrowConfigError) {
  const char* badMode[] = {"pybox", "--mode=batch", "f.py"};
  const char* badTimeout[] = {"pybox", "--timeout=0", "f.py"};
  const char* badParam[] = {"pybox", "--param=novalue", "f.py"};
  const char* badSeed[] = {"pybox", "--seed=-3", "f.py"};
  const char* emptyEntry[] = {"pybox", "--entry=", "f.py"};
  Options o;
  EXPECT_THROW(ParseArgs(3, const_cast<char**>(badMode), o), pybox::exceptions::ConfigError);
  EXPECT_THROW(ParseArgs(3, const_cast<char**>(badTimeout), o), pybox::exceptions::ConfigError);
  EXPECT_THROW(ParseArgs(3, const_cast<char**>(badParam), o), pybox::exceptions::ConfigError);
  EXPECT_THROW(ParseArgs(3, const_cast<char**>(badSeed), o), pybox::exceptions::ConfigError);
  EXPECT_THROW(ParseArgs(3, const_cast<char**>(emptyEntry), o), pybox::exceptions::ConfigError);
}
