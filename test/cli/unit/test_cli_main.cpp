/***
 * Name: test_cli_main
 * Purpose: Exit statuses and reports of a whole pybox invocation.
 */
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include "cli/App.h"
#include "cli/Usage.h"
#include "pybox/exceptions/config_error.h"
#include "pybox/exceptions/file_read_error.h"

using namespace pybox::cli;

namespace {

std::string writeFragment(const std::string& name, const std::string& source) {
  const auto path = std::filesystem::temp_directory_path() / ("pybox_cli_" + name + ".py");
  std::ofstream out(path);
  out << source;
  return path.string();
}

struct Invocation {
  int status{0};
  std::string out;
  std::string err;
};

Invocation invoke(std::initializer_list<const char*> args) {
  std::vector<const char*> argv{"pybox"};
  argv.insert(argv.end(), args.begin(), args.end());
  std::ostringstream out;
  std::ostringstream err;
  Invocation inv;
  inv.status = Main(static_cast<int>(argv.size()), const_cast<char**>(argv.data()), out, err);
  inv.out = out.str();
  inv.err = err.str();
  return inv;
}

} // namespace

TEST(CLI_Usage, ContainsExpectedFlags) {
  const auto u = Usage();
  EXPECT_NE(u.find("pybox [options] file"), std::string::npos);
  EXPECT_NE(u.find("--validate-only"), std::string::npos);
  EXPECT_NE(u.find("--mode=<mode>"), std::string::npos);
  EXPECT_NE(u.find("--param=<key>=<value>"), std::string::npos);
  EXPECT_NE(u.find("--metrics-json"), std::string::npos);
  EXPECT_NE(u.find("--                    End of options"), std::string::npos);
}

TEST(CLI_Main, HelpExitsZero) {
  const auto inv = invoke({"--help"});
  EXPECT_EQ(inv.status, 0);
  EXPECT_NE(inv.out.find("pybox [options] file"), std::string::npos);
}

TEST(CLI_Main, ExactlyOneInputRequired) {
  EXPECT_EQ(invoke({}).status, 2);
  const auto inv = invoke({"a.py", "b.py"});
  EXPECT_EQ(inv.status, 2);
  EXPECT_NE(inv.err.find("exactly one input file"), std::string::npos);
}

TEST(CLI_Main, ParseErrorPrintsUsage) {
  const auto inv = invoke({"--bogus", "a.py"});
  EXPECT_EQ(inv.status, 2);
  EXPECT_NE(inv.err.find("argument parse error"), std::string::npos);
}

TEST(CLI_Main, MissingFileIsHostError) {
  const auto inv = invoke({"/nonexistent/pybox/fragment.py"});
  EXPECT_EQ(inv.status, 2);
  EXPECT_EQ(inv.err.rfind("pybox: cannot open", 0), 0u);
}

TEST(CLI_Main, BadOptionValueIsHostError) {
  const auto inv = invoke({"--timeout=never", "a.py"});
  EXPECT_EQ(inv.status, 2);
  EXPECT_NE(inv.err.find("--timeout: expected a positive number of seconds"), std::string::npos);
}

TEST(CLI_Main, RunsAdHocFragment) {
  const std::string path = writeFragment("adhoc", "print(6 * 7)\nnh.search()\n");
  const auto inv = invoke({path.c_str()});
  EXPECT_EQ(inv.status, 0);
  EXPECT_EQ(inv.out.rfind("success: True\n", 0), 0u);
  EXPECT_NE(inv.out.find("stdout:\n42\n"), std::string::npos);
  EXPECT_NE(inv.out.find("call: search()\n"), std::string::npos);
}

TEST(CLI_Main, RejectedFragmentExitsOne) {
  const std::string path = writeFragment("rejected", "import os\nos.system('ls')\n");
  const auto inv = invoke({path.c_str()});
  EXPECT_EQ(inv.status, 1);
  EXPECT_NE(inv.out.find("success: False\n"), std::string::npos);
  EXPECT_NE(inv.out.find("Forbidden import: 'os'"), std::string::npos);
}

TEST(CLI_Main, ValidateOnlyNeverRuns) {
  const std::string path = writeFragment("validate", "nh.eat()\nwhile True:\n    pass\n");
  const auto inv = invoke({"--validate-only", path.c_str()});
  EXPECT_EQ(inv.status, 0);
  EXPECT_EQ(inv.out.rfind("valid: True\n", 0), 0u);
  EXPECT_NE(inv.out.find("actions: eat\n"), std::string::npos);
}

TEST(CLI_Main, NamedModePassesParams) {
  const std::string path = writeFragment("named",
                                         "async def go(nh, steps=1):\n"
                                         "    nh.rest(steps)\n"
                                         "    return SkillResult.stopped('rested', success=True, turns=steps)\n");
  const auto inv = invoke({"--mode=named", "--entry=go", "--param=steps=4", path.c_str()});
  EXPECT_EQ(inv.status, 0);
  EXPECT_NE(inv.out.find("call: rest()\n"), std::string::npos);
  EXPECT_NE(inv.out.find("stopped_reason: rested\n"), std::string::npos);
}

TEST(CLI_Config, TimeoutPrecedence) {
  Options opts;
  ::setenv(kTimeoutEnv, "7", 1);
  EXPECT_DOUBLE_EQ(ResolveSandboxConfig(opts).timeout.count(), 7.0);
  opts.timeoutSeconds = 1.5;
  EXPECT_DOUBLE_EQ(ResolveSandboxConfig(opts).timeout.count(), 1.5);
  opts.timeoutSeconds.reset();
  ::setenv(kTimeoutEnv, "zero", 1);
  EXPECT_THROW(ResolveSandboxConfig(opts), pybox::exceptions::ConfigError);
  ::unsetenv(kTimeoutEnv);
  EXPECT_DOUBLE_EQ(ResolveSandboxConfig(opts).timeout.count(), 30.0);
}

TEST(CLI_Config, ReadSourceMissingFileThrows) {
  EXPECT_THROW(ReadSource("/nonexistent/pybox/fragment.py"), pybox::exceptions::FileReadError);
}
