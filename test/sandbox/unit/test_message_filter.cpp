/***
 * Name: test_message_filter
 * Purpose: Windowing, dedupe, prompt removal and current-message handling.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sandbox/MessageFilter.h"

using namespace pybox;
using sandbox::filterMessages;

TEST(MessageFilter, RecognizesTransientPrompts) {
  EXPECT_TRUE(sandbox::isTransientPrompt("What do you want to eat? [fg or ?*]"));
  EXPECT_TRUE(sandbox::isTransientPrompt("   In what direction?"));
  EXPECT_FALSE(sandbox::isTransientPrompt("You see here a dagger."));
  EXPECT_FALSE(sandbox::isTransientPrompt(""));
}

TEST(MessageFilter, DropsDuplicatesKeepingFirst) {
  const std::vector<std::string> out = filterMessages({"A", "B", "A", "C", "B"}, "");
  EXPECT_EQ(out, (std::vector<std::string>{"A", "B", "C"}));
}

TEST(MessageFilter, DropsTransientPrompts) {
  const auto out = filterMessages({"What do you want to quaff? [a]", "You drink the potion."}, "");
  EXPECT_EQ(out, (std::vector<std::string>{"You drink the potion."}));
}

TEST(MessageFilter, PrependsCurrentMessageWhenAbsent) {
  EXPECT_EQ(filterMessages({"A"}, "C"), (std::vector<std::string>{"C", "A"}));
  EXPECT_EQ(filterMessages({"A", "C"}, "C"), (std::vector<std::string>{"A", "C"}));
  EXPECT_EQ(filterMessages({}, ""), (std::vector<std::string>{}));
}

TEST(MessageFilter, LongHistoryKeepsKillsAndTail) {
  std::vector<std::string> fresh;
  for (int i = 0; i < 250; ++i) {
    fresh.push_back(i == 5 ? "You kill the newt!" : "msg " + std::to_string(i));
  }
  const auto out = filterMessages(fresh, "");
  ASSERT_EQ(out.size(), sandbox::kMessageWindow + 1);
  EXPECT_EQ(out.front(), "You kill the newt!");
  EXPECT_EQ(out[1], "msg 50");
  EXPECT_EQ(out.back(), "msg 249");
}

TEST(MessageFilter, ShortHistoryUntouched) {
  std::vector<std::string> fresh;
  for (int i = 0; i < 20; ++i) { fresh.push_back("msg " + std::to_string(i)); }
  EXPECT_EQ(filterMessages(fresh, ""), fresh);
}
