/***
 * Name: test_capability_proxy
 * Purpose: Call recording, argument formatting and attribute exposure of `nh`.
 */
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pybox/exceptions/timeout_failure.h"
#include "runtime/Heap.h"
#include "runtime/Interpreter.h"
#include "runtime/Objects.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "sandbox/CapabilityProxy.h"
#include "sandbox/DomainTypes.h"
#include "sandbox/DryRunHandle.h"
#include "sandbox/NamespaceBuilder.h"

using namespace pybox;

namespace {

struct ProxyRun {
  rt::Interpreter interp;
  sandbox::DryRunHandle handle;
  std::shared_ptr<sandbox::CapabilityProxy> proxy;
  std::unique_ptr<ast::Module> module;

  explicit ProxyRun(const sandbox::Deadline* deadline = nullptr)
      : proxy(rt::make<sandbox::CapabilityProxy>(handle, deadline)) {
    sandbox::buildNamespace(interp, rt::Value(proxy), sandbox::SandboxConfig{});
  }

  void run(const std::string& src) {
    lex::Lexer lexer;
    lexer.pushString(src, "t.py");
    parse::Parser parser(lexer);
    module = parser.parseModule();
    interp.execModule(*module);
  }
};

rt::CallArgs positional(rt::ValueList values) {
  rt::CallArgs args;
  args.positional = std::move(values);
  return args;
}

} // namespace

TEST(CapabilityProxy, RecordsActionsInOrder) {
  ProxyRun r;
  r.run("nh.move(Direction.N)\n"
        "nh.get_position()\n"
        "nh.eat('abc')\n"
        "nh.search()\n");
  const auto& calls = r.proxy->calls();
  ASSERT_EQ(calls.size(), 3u);
  EXPECT_EQ(calls[0].method, "move");
  EXPECT_EQ(calls[0].formattedArgs, "N");
  EXPECT_TRUE(calls[0].success);
  EXPECT_FALSE(calls[0].error.has_value());
  EXPECT_EQ(calls[1].method, "eat");
  EXPECT_EQ(calls[1].formattedArgs, "'abc'");
  EXPECT_FALSE(calls[1].success);
  ASSERT_TRUE(calls[1].error.has_value());
  EXPECT_NE(calls[1].error->find("single inventory letter"), std::string::npos);
  EXPECT_EQ(calls[2].method, "search");
  EXPECT_EQ(calls[2].formattedArgs, "");
  EXPECT_EQ(r.handle.y(), 9);
}

TEST(CapabilityProxy, ExplorationOutcomeKept) {
  ProxyRun r;
  r.run("res = nh.autoexplore(max_steps=5)\n");
  ASSERT_EQ(r.proxy->calls().size(), 1u);
  EXPECT_EQ(r.proxy->calls()[0].formattedArgs, "max_steps=5");
  ASSERT_TRUE(r.proxy->exploration().has_value());
  EXPECT_EQ(r.proxy->exploration()->stopReason, "max_steps");
  EXPECT_EQ(r.proxy->exploration()->stepsTaken, 5);
  EXPECT_EQ(r.proxy->exploration()->message, "Step limit reached.");
}

TEST(CapabilityProxy, FailedExplorationUsesStopReason) {
  ProxyRun r;
  r.handle.failNext("autoexplore", "");
  r.run("nh.autoexplore()\n");
  const auto& call = r.proxy->calls().at(0);
  EXPECT_EQ(call.formattedArgs, "max_steps=500");
  EXPECT_FALSE(call.success);
  EXPECT_EQ(call.error.value_or(""), "stopped: no_observation");
}

TEST(CapabilityProxy, FailureUsesHandleError) {
  ProxyRun r;
  r.handle.failNext("pray", "You feel that Anhur is displeased.");
  r.run("nh.pray()\n");
  EXPECT_EQ(r.proxy->calls().at(0).error.value_or(""), "You feel that Anhur is displeased.");
}

TEST(CapabilityProxy, RaisingCallLeavesNoRecord) {
  ProxyRun r;
  r.handle.raiseNext("search", "connection lost");
  try {
    r.run("nh.search()\n");
    FAIL() << "expected ScriptError";
  } catch (const rt::ScriptError& e) {
    EXPECT_EQ(e.typeName(), "RuntimeError");
    EXPECT_EQ(e.detail(), "connection lost");
  }
  EXPECT_TRUE(r.proxy->calls().empty());
}

TEST(CapabilityProxy, PropertiesReadable) {
  ProxyRun r;
  r.run("print(nh.turn, nh.position, nh.is_done)\n");
  EXPECT_EQ(r.interp.console(), "1 Position(x=10, y=10) False\n");
}

TEST(CapabilityProxy, UnknownAttributeRaises) {
  ProxyRun r;
  try {
    r.run("x = nh.handle_\n");
    FAIL() << "expected ScriptError";
  } catch (const rt::ScriptError& e) {
    EXPECT_EQ(e.typeName(), "AttributeError");
  }
}

TEST(CapabilityProxy, ExpiredDeadlineStopsCalls) {
  const sandbox::Deadline spent(std::chrono::microseconds(0));
  ProxyRun r(&spent);
  EXPECT_THROW(r.run("nh.search()\n"), exceptions::TimeoutFailure);
  EXPECT_EQ(r.handle.invocations(), 0u);
}

TEST(FormatArguments, RendersEachActionShape) {
  rt::Interpreter interp;
  EXPECT_EQ(sandbox::formatArguments(interp, "move_to", positional({sandbox::makePosition(3, 4)})), "(3, 4)");
  EXPECT_EQ(sandbox::formatArguments(interp, "zap", positional({rt::newStr("f"), sandbox::direction("E")})),
            "'f', E");
  EXPECT_EQ(sandbox::formatArguments(interp, "travel_to", positional({rt::newStr("<")})), "'<'");
  EXPECT_EQ(sandbox::formatArguments(interp, "send_keys", positional({rt::newStr("ab")})), "'ab'");
  EXPECT_EQ(sandbox::formatArguments(interp, "send_keys", positional({rt::newStr("abcdefgh")})), "'abcde...'");
  EXPECT_EQ(sandbox::formatArguments(interp, "autoexplore", rt::CallArgs{}), "max_steps=500");
  EXPECT_EQ(sandbox::formatArguments(interp, "rest", positional({rt::Value::integer(5)})), "");
  EXPECT_EQ(sandbox::formatArguments(interp, "move", rt::CallArgs{}), "");
}
