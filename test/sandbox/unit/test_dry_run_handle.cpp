/***
 * Name: test_dry_run_handle
 * Purpose: Offline handle behaviour as seen from fragment code, plus domain types.
 */
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "runtime/Heap.h"
#include "runtime/Interpreter.h"
#include "runtime/ScriptError.h"
#include "sandbox/ActionCatalog.h"
#include "sandbox/CapabilityProxy.h"
#include "sandbox/DryRunHandle.h"
#include "sandbox/NamespaceBuilder.h"

using namespace pybox;

namespace {

struct HandleRun {
  rt::Interpreter interp;
  sandbox::DryRunHandle handle;
  std::unique_ptr<ast::Module> module;

  HandleRun() {
    sandbox::buildNamespace(interp, rt::Value(rt::make<sandbox::CapabilityProxy>(handle, nullptr)),
                            sandbox::SandboxConfig{});
  }

  std::string run(const std::string& src) {
    lex::Lexer lexer;
    lexer.pushString(src, "t.py");
    parse::Parser parser(lexer);
    module = parser.parseModule();
    interp.execModule(*module);
    return interp.console();
  }

  std::string errorOf(const std::string& src) {
    try {
      run(src);
    } catch (const rt::ScriptError& e) {
      return e.what();
    }
    return "";
  }
};

} // namespace

TEST(DryRunHandle, ExposesCatalogAndQueries) {
  sandbox::DryRunHandle handle;
  EXPECT_TRUE(handle.hasMethod("move"));
  EXPECT_TRUE(handle.hasMethod("autoexplore"));
  EXPECT_TRUE(handle.hasMethod("get_stats"));
  EXPECT_FALSE(handle.hasMethod("__init__"));
  EXPECT_EQ(handle.methodNames().size(), sandbox::kActionMethods.size() + 1 + 9);
  EXPECT_EQ(handle.turn(), 1);
}

TEST(DryRunHandle, ActionsAdvanceTurnsAndPosition) {
  HandleRun r;
  const std::string out = r.run(
      "res = nh.eat()\n"
      "print(res.success, res.messages)\n"
      "nh.move_to(Position(13, 14))\n"
      "print(nh.turn, nh.get_position())\n"
      "nh.rest(5)\n"
      "nh.look()\n"
      "print(nh.turn)\n"
      "nh.go_down()\n"
      "s = nh.get_stats()\n"
      "print(s.hp, s.dungeon_level, s.hunger.name)\n"
      "print(nh.find_stairs(), nh.get_inventory(), nh.get_messages(1))\n");
  EXPECT_EQ(out,
            "True ['This food is delicious!']\n"
            "6 Position(x=13, y=14)\n"
            "11\n"
            "16 2 NOT_HUNGRY\n"
            "(None, None) [] ['This food is delicious!']\n");
  EXPECT_EQ(r.handle.messageCount(), 1u);
  EXPECT_EQ(r.handle.currentMessage(), "This food is delicious!");
}

TEST(DryRunHandle, ItemLetterValidation) {
  HandleRun r;
  const std::string out = r.run(
      "a = nh.quaff()\n"
      "b = nh.quaff('ab')\n"
      "c = nh.quaff('a')\n"
      "print(a.success, a.error, b.success, c.success)\n");
  EXPECT_EQ(out, "False item_letter must be a single character False True\n");
}

TEST(DryRunHandle, DirectionArgumentChecked) {
  HandleRun r;
  EXPECT_EQ(r.errorOf("nh.move('north')\n"), "TypeError: move() argument must be a Direction, not 'str'");
}

TEST(DryRunHandle, MoveToRequiresPosition) {
  HandleRun r;
  EXPECT_EQ(r.errorOf("nh.move_to((1, 2))\n"), "TypeError: move_to() argument must be a Position, not 'tuple'");
}

TEST(DryRunHandle, AutoexploreStopsAtLevelEdge) {
  HandleRun r;
  const std::string out = r.run(
      "a = nh.autoexplore(max_steps=3)\n"
      "b = nh.autoexplore()\n"
      "print(a.stop_reason, a.steps_taken, b.stop_reason, b.steps_taken, nh.turn)\n");
  EXPECT_EQ(out, "max_steps 3 fully_explored 12 16\n");
}

TEST(DomainTypes, PositionArithmeticAndDirections) {
  HandleRun r;
  const std::string out = r.run(
      "p = Position(3, 4)\n"
      "q = Position(6, 8)\n"
      "print(p.distance_to(q), p.direction_to(q).name, p == Position(3, 4))\n"
      "print(p + (1, -1), p.move(Direction.N), len(p.adjacent()))\n");
  EXPECT_EQ(out, "4 SE True\nPosition(x=4, y=3) Position(x=3, y=3) 8\n");
}

TEST(DomainTypes, SkillResultFields) {
  HandleRun r;
  const std::string out = r.run(
      "a = SkillResult('done', {'k': 1}, 2, 3, True)\n"
      "print(a.stopped_reason, a.data, a.actions_taken, a.turns_elapsed, a.success)\n"
      "b = SkillResult.stopped('hp_low', hp=4)\n"
      "print(b.stopped_reason, b.data, b.success, b.actions_taken)\n");
  EXPECT_EQ(out, "done {'k': 1} 2 3 True\nhp_low {'hp': 4} False 0\n");
}

TEST(DomainTypes, SkillResultDataMustBeDict) {
  HandleRun r;
  EXPECT_EQ(r.errorOf("x = SkillResult('oops', [1])\n"), "TypeError: SkillResult data must be a dict, not list");
}
