/***
 * Name: test_translate_error
 * Purpose: Raw handle failures mapped to actionable hints.
 */
#include <gtest/gtest.h>

#include <string>

#include "sandbox/CapabilityProxy.h"

using namespace pybox;
using sandbox::translateError;

TEST(TranslateError, ItemLetterHintNamesMethod) {
  const std::string hint = translateError("ord() expected a character, but string of length 6 found", "quaff");
  EXPECT_NE(hint.find("Invalid item letter for quaff()"), std::string::npos);
}

TEST(TranslateError, SingleCharacterHint) {
  EXPECT_EQ(translateError("TypeError: expected str of length 1", "read"),
            "Invalid argument to read(). Expected single character (e.g., 'a'), got string.");
}

TEST(TranslateError, PathfindingHints) {
  EXPECT_EQ(translateError("No path through explored territory to (3, 4)", "travel_to"),
            "Path goes through unexplored areas. Explore corridors/rooms between you and target first.");
  EXPECT_NE(translateError("Hostile monsters in view", "travel_to").find("Cannot pathfind"), std::string::npos);
  EXPECT_EQ(translateError("Position(1, 1) is not walkable", "move_to"),
            "Target position is blocked (wall, boulder, closed door, or monster).");
}

TEST(TranslateError, DryRunLetterFailureTranslated) {
  EXPECT_NE(translateError("item_letter must be a single character", "eat").find("single inventory letter"),
            std::string::npos);
}

TEST(TranslateError, UnknownTextPassesThrough) {
  EXPECT_EQ(translateError("You can't do that.", "pray"), "You can't do that.");
  EXPECT_EQ(translateError("", "move"), "");
}
