/***
 * Name: test_sandbox_execute
 * Purpose: End-to-end validate-then-execute runs against the dry-run handle.
 */
#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <string>

#include "pybox/exceptions/config_error.h"
#include "sandbox/DryRunHandle.h"
#include "sandbox/Sandbox.h"
#include "sandbox/TimeoutGovernor.h"

using namespace pybox;
using sandbox::CodeSubmission;
using sandbox::FailureKind;
using sema::FragmentMode;

namespace {

CodeSubmission adhoc(const std::string& source) {
  CodeSubmission s;
  s.source = source;
  return s;
}

CodeSubmission named(const std::string& source, const std::string& entry) {
  CodeSubmission s;
  s.source = source;
  s.mode = FragmentMode::Named;
  s.entryName = entry;
  return s;
}

} // namespace

TEST(SandboxExecute, AdHocArithmeticSucceeds) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  const auto result = box.execute(adhoc("x = 1 + 1\n"), handle);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.failure, FailureKind::None);
  EXPECT_FALSE(result.error.has_value());
  EXPECT_TRUE(result.apiCalls.empty());
  EXPECT_TRUE(result.capturedOutput.empty());
  EXPECT_EQ(result.payload, sandbox::PayloadValue(sandbox::PayloadValue::Map{}));
  EXPECT_GE(result.elapsed.count(), 0.0);
}

TEST(SandboxExecute, NamedSkillReturnsSkillResult) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  const auto result = box.execute(named(
      "async def step_north(nh, **params):\n"
      "    res = await nh.move(Direction.N)\n"
      "    return SkillResult.stopped('moved', success=res.success, actions=1, turns=1, steps=1)\n",
      "step_north"), handle);
  ASSERT_TRUE(result.success) << result.error.value_or("");
  EXPECT_EQ(result.actionsTaken, 1);
  EXPECT_EQ(result.turnsElapsed, 1);
  ASSERT_EQ(result.apiCalls.size(), 1u);
  EXPECT_EQ(result.apiCalls[0].method, "move");
  EXPECT_EQ(result.apiCalls[0].formattedArgs, "N");
  const auto& p = result.payload;
  ASSERT_NE(p.find("stopped_reason"), nullptr);
  EXPECT_EQ(p.find("stopped_reason")->asString(), "moved");
  EXPECT_TRUE(p.find("success")->asBool());
  EXPECT_EQ(p.find("steps")->asInt(), 1);
  ASSERT_NE(p.find("api_calls"), nullptr);
  EXPECT_EQ(p.find("api_calls")->asList().size(), 1u);
  EXPECT_EQ(handle.y(), 9);
}

TEST(SandboxExecute, NamedParametersArriveAsKeywords) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  auto submission = named(
      "async def walk(nh, **params):\n"
      "    for _ in range(params.get('steps', 0)):\n"
      "        await nh.move(Direction.E)\n"
      "    return {'walked': params['steps']}\n",
      "walk");
  submission.parameters.emplace_back("steps", 3);
  const auto result = box.execute(submission, handle);
  ASSERT_TRUE(result.success) << result.error.value_or("");
  EXPECT_EQ(handle.x(), 13);
  EXPECT_EQ(result.apiCalls.size(), 3u);
  ASSERT_NE(result.payload.find("result"), nullptr);
  EXPECT_EQ(result.payload.find("result")->find("walked")->asInt(), 3);
}

TEST(SandboxExecute, ForbiddenImportNeverRuns) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  const auto result = box.execute(adhoc("import os\nawait nh.move(Direction.N)\n"), handle);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, FailureKind::Validation);
  EXPECT_EQ(result.error.value_or(""), "Validation failed: Security violation: Forbidden import: 'os' (line 1)");
  EXPECT_EQ(handle.invocations(), 0u);
  EXPECT_TRUE(result.apiCalls.empty());
}

TEST(SandboxExecute, ForbiddenAttributeOnHandleRejected) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  const auto result = box.execute(adhoc("t = nh.__class__\n"), handle);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, FailureKind::Validation);
  ASSERT_TRUE(result.validation.violation.has_value());
  EXPECT_EQ(result.validation.violation->category, exceptions::ViolationCategory::Attribute);
  EXPECT_EQ(handle.invocations(), 0u);
}

TEST(SandboxExecute, InfiniteLoopTimesOutThenNextRunSucceeds) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  auto looping = adhoc("while True:\n    pass\n");
  looping.timeout = std::chrono::duration<double>(0.5);
  const auto timedOut = box.execute(looping, handle);
  EXPECT_FALSE(timedOut.success);
  EXPECT_EQ(timedOut.failure, FailureKind::Timeout);
  EXPECT_EQ(timedOut.error.value_or(""), "Code execution timed out after 0.5 seconds (possible infinite loop)");
  EXPECT_GE(timedOut.elapsed.count(), 0.4);
  EXPECT_FALSE(sandbox::AlarmGuard::armed());

  const auto next = box.execute(adhoc("print('still alive')\n"), handle);
  EXPECT_TRUE(next.success) << next.error.value_or("");
  EXPECT_EQ(next.capturedOutput, "still alive\n");
}

TEST(SandboxExecute, RuntimeErrorReported) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  const auto result = box.execute(adhoc("print('before')\nx = 1 / 0\n"), handle);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, FailureKind::Runtime);
  EXPECT_EQ(result.error.value_or(""), "ZeroDivisionError: division by zero");
  EXPECT_EQ(result.capturedOutput, "before\n");
  ASSERT_NE(result.payload.find("stdout"), nullptr);
}

TEST(SandboxExecute, NamedWithoutEntryIsValidationFailure) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  const auto result = box.execute(named("x = 1\n", "missing"), handle);
  EXPECT_EQ(result.failure, FailureKind::Validation);
  EXPECT_EQ(result.validation.errorKind, sema::ValidationErrorKind::MissingEntryPoint);
}

TEST(SandboxExecute, EntryShadowedAtRuntimeIsMissing) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  const auto result = box.execute(named(
      "async def go(nh):\n"
      "    pass\n"
      "del go\n",
      "go"), handle);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, FailureKind::MissingEntryPoint);
  EXPECT_EQ(result.error.value_or(""), "Function 'go' not found after execution");
}

TEST(SandboxExecute, ImportsOfAllowedModulesAreNeutralized) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  const auto result = box.execute(adhoc("import math\nprint(math.floor(2.5))\n"), handle);
  ASSERT_TRUE(result.success) << result.error.value_or("");
  EXPECT_EQ(result.capturedOutput, "2\n");
}

TEST(SandboxExecute, AdHocReturnValueAndSideEffects) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  const auto result = box.execute(adhoc(
      "r = await nh.autoexplore(max_steps=20)\n"
      "await nh.pray()\n"
      "return r.steps_taken\n"), handle);
  ASSERT_TRUE(result.success) << result.error.value_or("");
  ASSERT_NE(result.payload.find("return_value"), nullptr);
  EXPECT_EQ(result.payload.find("return_value")->asInt(), 12);
  ASSERT_TRUE(result.exploration.has_value());
  EXPECT_EQ(result.exploration->stopReason, "fully_explored");
  ASSERT_NE(result.payload.find("autoexplore_result"), nullptr);
  ASSERT_EQ(result.gameMessages.size(), 1u);
  EXPECT_EQ(result.gameMessages[0], "You begin praying to the gods.");
}

TEST(SandboxExecute, ScreenMessageReportedWithoutActions) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  handle.addMessage("old news");
  handle.setCurrentMessage("Hello Agent, welcome to NetHack!");
  const auto result = box.execute(adhoc("x = 1\n"), handle);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.gameMessages.size(), 1u);
  EXPECT_EQ(result.gameMessages[0], "Hello Agent, welcome to NetHack!");
  ASSERT_NE(result.payload.find("game_messages"), nullptr);
}

TEST(SandboxExecute, SeededRandomRepeats) {
  sandbox::SandboxConfig config;
  config.randomSeed = 7;
  sandbox::Sandbox box(config);
  sandbox::DryRunHandle handle;
  const auto a = box.execute(adhoc("print(random.randint(1, 1000000))\n"), handle);
  const auto b = box.execute(adhoc("print(random.randint(1, 1000000))\n"), handle);
  ASSERT_TRUE(a.success);
  EXPECT_EQ(a.capturedOutput, b.capturedOutput);
}

TEST(SandboxExecute, NonPositiveTimeoutIsInternalFailure) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  auto submission = adhoc("x = 1\n");
  submission.timeout = std::chrono::duration<double>(0.0);
  const auto result = box.execute(submission, handle);
  EXPECT_EQ(result.failure, FailureKind::Internal);
  EXPECT_EQ(handle.invocations(), 0u);
}

TEST(SandboxConfig, RejectsInvalidSettings) {
  sandbox::SandboxConfig config;
  config.timeout = std::chrono::duration<double>(-1.0);
  EXPECT_THROW(sandbox::Sandbox{config}, exceptions::ConfigError);
  config.timeout = std::chrono::duration<double>(1.0);
  config.maxCallDepth = 0;
  EXPECT_THROW(sandbox::Sandbox{config}, exceptions::ConfigError);
  EXPECT_EQ(sandbox::formatSeconds(std::chrono::duration<double>(30.0)), "30");
  EXPECT_EQ(sandbox::formatSeconds(std::chrono::duration<double>(0.25)), "0.25");
}

TEST(SandboxExecute, DeeplyNestedDataDoesNotCrashHost) {
  sandbox::Sandbox box;
  sandbox::DryRunHandle handle;
  auto submission = adhoc("x = []\n"
                          "for i in range(200000):\n"
                          "    x = [x]\n"
                          "return x\n");
  submission.timeout = std::chrono::duration<double>(5.0);
  const auto result = box.execute(submission, handle);
  ASSERT_TRUE(result.success) << result.error.value_or("");
  const sandbox::PayloadValue* value = result.payload.find("return_value");
  ASSERT_NE(value, nullptr);
  std::size_t depth = 0;
  while (value->isList()) {
    ASSERT_EQ(value->asList().size(), 1u);
    value = &value->asList()[0];
    ++depth;
  }
  EXPECT_EQ(value->asString(), "...");
  EXPECT_LE(depth, 1000u);
}
