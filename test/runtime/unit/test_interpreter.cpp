/***
 * Name: test_interpreter
 * Purpose: Evaluation semantics of the tree-walking interpreter.
 */
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "runtime/Interpreter.h"
#include "runtime/ScriptError.h"

using namespace pybox;

namespace {

struct Script {
  std::unique_ptr<ast::Module> module;
  rt::Interpreter interp;

  explicit Script(const std::string& src, rt::InterpreterLimits limits = {}) : interp(limits) {
    lex::Lexer lexer;
    lexer.pushString(src, "t.py");
    parse::Parser parser(lexer);
    module = parser.parseModule();
    interp.installBuiltins();
  }

  std::string run() {
    interp.execModule(*module);
    return interp.console();
  }
};

std::string output(const std::string& src) {
  Script s(src);
  return s.run();
}

} // namespace

TEST(Interpreter, ArithmeticAndPrint) {
  EXPECT_EQ(output("print(1 + 2, 7 // 2, 7 % 3, 2 ** 10)\nprint(7 / 2)\n"), "3 3 1 1024\n3.5\n");
}

TEST(Interpreter, PrintSeparatorAndEnd) {
  EXPECT_EQ(output("print('a', 'b', sep='-', end='!')\n"), "a-b!");
}

TEST(Interpreter, StringOperations) {
  EXPECT_EQ(output("s = 'ab' * 3\nprint(s, len(s), s.upper())\nprint(', '.join(['x', 'y']))\n"),
            "ababab 6 ABABAB\nx, y\n");
}

TEST(Interpreter, FStringFormatting) {
  EXPECT_EQ(output("x = 1.5\nname = 'nh'\nprint(f'{name}: {x:.2f}')\n"), "nh: 1.50\n");
}

TEST(Interpreter, ContainersAndComprehensions) {
  EXPECT_EQ(output("xs = [i * i for i in range(5) if i % 2 == 0]\n"
                   "print(xs)\n"
                   "d = {'a': 1}\n"
                   "d['b'] = 2\n"
                   "print(sorted(d.keys()), d.get('z', 0))\n"),
            "[0, 4, 16]\n['a', 'b'] 0\n");
}

TEST(Interpreter, TryExceptFinally) {
  EXPECT_EQ(output("try:\n"
                   "    1 / 0\n"
                   "except ZeroDivisionError as e:\n"
                   "    print('caught', e)\n"
                   "finally:\n"
                   "    print('done')\n"),
            "caught division by zero\ndone\n");
}

TEST(Interpreter, UncaughtExceptionBecomesScriptError) {
  Script s("raise ValueError('bad value')\n");
  try {
    s.run();
    FAIL() << "expected ScriptError";
  } catch (const rt::ScriptError& e) {
    EXPECT_EQ(e.typeName(), "ValueError");
    EXPECT_EQ(e.detail(), "bad value");
    EXPECT_EQ(std::string(e.what()), "ValueError: bad value");
  }
}

TEST(Interpreter, UndefinedNameRaisesNameError) {
  Script s("print(missing)\n");
  try {
    s.run();
    FAIL() << "expected ScriptError";
  } catch (const rt::ScriptError& e) {
    EXPECT_EQ(e.typeName(), "NameError");
    EXPECT_EQ(e.detail(), "name 'missing' is not defined");
  }
}

TEST(Interpreter, ClosuresCaptureEnclosingScope) {
  EXPECT_EQ(output("def make(n):\n"
                   "    def add(x):\n"
                   "        return x + n\n"
                   "    return add\n"
                   "print(make(3)(4))\n"),
            "7\n");
}

TEST(Interpreter, AwaitDrivesCoroutine) {
  Script s("async def double(x):\n"
           "    return x * 2\n"
           "async def outer():\n"
           "    return await double(21)\n");
  s.run();
  const rt::Value* outer = s.interp.lookupGlobal("outer");
  ASSERT_NE(outer, nullptr);
  const rt::Value result = s.interp.await(s.interp.call(*outer, rt::CallArgs{}));
  ASSERT_TRUE(result.isInt());
  EXPECT_EQ(result.asInt(), 42);
}

TEST(Interpreter, SetGlobalVisibleToScript) {
  Script s("print(answer + 1)\n");
  s.interp.setGlobal("answer", rt::Value::integer(41));
  EXPECT_EQ(s.run(), "42\n");
}

TEST(Interpreter, ClassDefinitionsRejected) {
  Script s("class Foo:\n    pass\n");
  try {
    s.run();
    FAIL() << "expected ScriptError";
  } catch (const rt::ScriptError& e) {
    EXPECT_EQ(e.typeName(), "NotImplementedError");
  }
}

TEST(Interpreter, ImportStatementsUnavailable) {
  Script s("import math\n");
  EXPECT_THROW(s.run(), rt::ScriptError);
}
