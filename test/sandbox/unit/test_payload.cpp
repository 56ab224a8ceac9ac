/***
 * Name: test_payload
 * Purpose: Payload rendering and conversion from script values.
 */
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "runtime/Interpreter.h"
#include "runtime/Ops.h"
#include "sandbox/Payload.h"

using namespace pybox;
using sandbox::PayloadValue;

namespace {

// Runs `src` and converts the global `v`.
PayloadValue convertGlobal(const std::string& src) {
  lex::Lexer lexer;
  lexer.pushString(src, "t.py");
  parse::Parser parser(lexer);
  auto mod = parser.parseModule();
  rt::Interpreter interp;
  interp.installBuiltins();
  interp.execModule(*mod);
  const rt::Value* v = interp.lookupGlobal("v");
  return v != nullptr ? sandbox::toPayload(*v) : PayloadValue();
}

} // namespace

TEST(Payload, JsonRendering) {
  const PayloadValue p(PayloadValue::Map{
      {"a", 1}, {"b", PayloadValue::List{true, PayloadValue(), "x\"y"}}, {"c", 1.5}});
  EXPECT_EQ(p.toJson(), "{\"a\": 1, \"b\": [true, null, \"x\\\"y\"], \"c\": 1.5}");
}

TEST(Payload, TextRendering) {
  const PayloadValue p(PayloadValue::Map{{"k", "v"}, {"n", PayloadValue()}, {"ok", false}});
  EXPECT_EQ(p.toText(), "{'k': 'v', 'n': None, 'ok': False}");
  EXPECT_EQ(PayloadValue(PayloadValue::List{1, 2}).toText(), "[1, 2]");
}

TEST(Payload, SetReplacesInPlace) {
  PayloadValue p(PayloadValue::Map{{"a", 1}, {"b", 2}});
  p.set("a", 10);
  p.set("c", 3);
  ASSERT_EQ(p.asMap().size(), 3u);
  EXPECT_EQ(p.asMap()[0].first, "a");
  EXPECT_EQ(p.asMap()[0].second.asInt(), 10);
  EXPECT_EQ(p.asMap()[2].first, "c");
  ASSERT_NE(p.find("b"), nullptr);
  EXPECT_EQ(p.find("b")->asInt(), 2);
  EXPECT_EQ(p.find("zzz"), nullptr);
}

TEST(Payload, SetOnScalarStartsMap) {
  PayloadValue p(5);
  p.set("k", "v");
  ASSERT_TRUE(p.isMap());
  EXPECT_EQ(p.asMap().size(), 1u);
}

TEST(Payload, ConvertsScriptContainers) {
  const PayloadValue p = convertGlobal("v = {'a': [1, (2, 3)], 'b': None, 'c': 'text', 'd': 2.5}\n");
  const PayloadValue expected(PayloadValue::Map{
      {"a", PayloadValue::List{1, PayloadValue::List{2, 3}}},
      {"b", PayloadValue()},
      {"c", "text"},
      {"d", 2.5}});
  EXPECT_EQ(p, expected);
}

TEST(Payload, NonStringKeysUseStr) {
  const PayloadValue p = convertGlobal("v = {1: 'one', True: 'yes'}\n");
  ASSERT_TRUE(p.isMap());
  EXPECT_EQ(p.asMap()[0].first, "1");
}

TEST(Payload, SelfReferenceIsCut) {
  const PayloadValue p = convertGlobal("v = []\nv.append(v)\n");
  ASSERT_TRUE(p.isList());
  ASSERT_EQ(p.asList().size(), 1u);
  EXPECT_EQ(p.asList()[0].asString(), "[...]");
}

TEST(Payload, OpaqueValuesUseRepr) {
  const PayloadValue p = convertGlobal("def f():\n    pass\nv = f\n");
  ASSERT_TRUE(p.isString());
  EXPECT_NE(p.asString().find("function"), std::string::npos);
}

TEST(Payload, FromPayloadBuildsDict) {
  rt::Interpreter interp;
  const rt::Value v = sandbox::fromPayload(PayloadValue(PayloadValue::Map{{"n", 3}, {"tags", PayloadValue::List{"a"}}}));
  EXPECT_EQ(rt::repr(v), "{'n': 3, 'tags': ['a']}");
}
