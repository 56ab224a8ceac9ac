/***
 * Name: test_interpreter_limits
 * Purpose: Call depth, sequence length and interrupt guards.
 */
#include <gtest/gtest.h>

#include <csignal>
#include <memory>
#include <string>

#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pybox/exceptions/timeout_failure.h"
#include "runtime/Builtins.h"
#include "runtime/Interpreter.h"
#include "runtime/ScriptError.h"

using namespace pybox;

static std::unique_ptr<ast::Module> parseSrc(const std::string& src) {
  lex::Lexer lexer;
  lexer.pushString(src, "t.py");
  parse::Parser parser(lexer);
  return parser.parseModule();
}

static std::string errorType(rt::Interpreter& interp, const ast::Module& mod) {
  try {
    interp.execModule(mod);
  } catch (const rt::ScriptError& e) {
    return e.typeName();
  }
  return "";
}

TEST(InterpreterLimits, RecursionDepthCapped) {
  auto mod = parseSrc("def r(n):\n    return r(n + 1)\nr(0)\n");
  rt::Interpreter interp(rt::InterpreterLimits{20, 10'000'000});
  interp.installBuiltins();
  EXPECT_EQ(errorType(interp, *mod), "RecursionError");
}

// RecursionError is not a fragment-visible name; its RuntimeError base is.
TEST(InterpreterLimits, RecursionErrorIsCatchable) {
  auto mod = parseSrc("def r(n):\n"
                      "    return r(n + 1)\n"
                      "try:\n"
                      "    r(0)\n"
                      "except RuntimeError:\n"
                      "    print('deep')\n");
  rt::Interpreter interp(rt::InterpreterLimits{20, 10'000'000});
  interp.installBuiltins();
  interp.execModule(*mod);
  EXPECT_EQ(interp.console(), "deep\n");
}

TEST(InterpreterLimits, SequenceRepetitionCapped) {
  auto mod = parseSrc("x = [0] * 5000\n");
  rt::Interpreter interp(rt::InterpreterLimits{100, 1000});
  interp.installBuiltins();
  EXPECT_EQ(errorType(interp, *mod), "MemoryError");
}

TEST(InterpreterLimits, SequenceWithinCapAllowed) {
  auto mod = parseSrc("x = [0] * 500\nprint(len(x))\n");
  rt::Interpreter interp(rt::InterpreterLimits{100, 1000});
  interp.installBuiltins();
  interp.execModule(*mod);
  EXPECT_EQ(interp.console(), "500\n");
}

TEST(InterpreterLimits, InterruptFlagStopsLoop) {
  auto mod = parseSrc("while True:\n    pass\n");
  rt::Interpreter interp;
  interp.installBuiltins();
  static volatile std::sig_atomic_t flag = 1;
  interp.setInterruptFlag(&flag);
  EXPECT_THROW(interp.execModule(*mod), exceptions::TimeoutFailure);
}

TEST(InterpreterLimits, InterruptNotCatchableByScript) {
  auto mod = parseSrc("try:\n"
                      "    while True:\n"
                      "        pass\n"
                      "except Exception:\n"
                      "    print('swallowed')\n");
  rt::Interpreter interp;
  interp.installBuiltins();
  static volatile std::sig_atomic_t flag = 1;
  interp.setInterruptFlag(&flag);
  EXPECT_THROW(interp.execModule(*mod), exceptions::TimeoutFailure);
  EXPECT_EQ(interp.console(), "");
}

TEST(InterpreterLimits, SeededRandomIsReproducible) {
  auto mod = parseSrc("print([random.randint(1, 1000) for _ in range(5)])\n");
  std::string outputs[2];
  for (auto& out : outputs) {
    rt::Interpreter interp;
    interp.installBuiltins();
    interp.setGlobal("random", rt::makeRandomModule());
    interp.seedRandom(1234);
    interp.execModule(*mod);
    out = interp.console();
  }
  EXPECT_EQ(outputs[0], outputs[1]);
  EXPECT_FALSE(outputs[0].empty());
}

TEST(InterpreterLimits, RecursionErrorNameNotExposed) {
  auto mod = parseSrc("x = RecursionError\n");
  rt::Interpreter interp;
  interp.installBuiltins();
  EXPECT_EQ(errorType(interp, *mod), "NameError");
}

TEST(InterpreterLimits, DeepListChainFreedWithoutRecursion) {
  auto mod = parseSrc("x = []\n"
                      "for i in range(200000):\n"
                      "    x = [x]\n"
                      "x = None\n"
                      "y = {}\n"
                      "for i in range(200000):\n"
                      "    y = {'next': (y,)}\n");
  {
    rt::Interpreter interp;
    interp.installBuiltins();
    interp.execModule(*mod);
    EXPECT_EQ(interp.console(), "");
  }
  SUCCEED();
}

TEST(InterpreterLimits, DeepClosureChainFreedWithoutRecursion) {
  auto mod = parseSrc("def wrap(g):\n"
                      "    def inner():\n"
                      "        return g\n"
                      "    return inner\n"
                      "f = None\n"
                      "for i in range(100000):\n"
                      "    f = wrap(f)\n"
                      "print(f() is not None)\n");
  rt::Interpreter interp;
  interp.installBuiltins();
  interp.execModule(*mod);
  EXPECT_EQ(interp.console(), "True\n");
}
