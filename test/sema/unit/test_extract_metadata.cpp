/***
 * Name: test_extract_metadata
 * Purpose: Description, category and stop conditions from the entry docstring.
 */
#include <gtest/gtest.h>

#include "sema/SkillMetadata.h"

using namespace pybox;

TEST(ExtractMetadata, ReadsDocstringFields) {
  const auto meta = sema::extractMetadata(
      "async def descend(nh, **params):\n"
      "    \"\"\"Walk to the stairs\n"
      "    and go down.\n"
      "\n"
      "    Category: Navigation\n"
      "    Stops when: stairs reached, hp low\n"
      "    \"\"\"\n"
      "    await nh.go_down()\n");
  EXPECT_EQ(meta.description, "Walk to the stairs and go down.");
  EXPECT_EQ(meta.category, "navigation");
  ASSERT_EQ(meta.stopsWhen.size(), 2u);
  EXPECT_EQ(meta.stopsWhen[0], "stairs reached");
  EXPECT_EQ(meta.stopsWhen[1], "hp low");
}

TEST(ExtractMetadata, DefaultsWithoutDocstring) {
  const auto meta = sema::extractMetadata("async def go(nh):\n    pass\n");
  EXPECT_TRUE(meta.description.empty());
  EXPECT_EQ(meta.category, "general");
  EXPECT_TRUE(meta.stopsWhen.empty());
}

TEST(ExtractMetadata, DefaultsOnSyntaxError) {
  const auto meta = sema::extractMetadata("async def go(nh:\n");
  EXPECT_EQ(meta.category, "general");
  EXPECT_TRUE(meta.description.empty());
}

TEST(ExtractMetadata, DescriptionStopsAtFieldLine) {
  const auto meta = sema::extractMetadata(
      "async def fight(nh):\n"
      "    \"\"\"Attack adjacent hostiles.\n"
      "    Category: combat\n"
      "    \"\"\"\n");
  EXPECT_EQ(meta.description, "Attack adjacent hostiles.");
  EXPECT_EQ(meta.category, "combat");
}
