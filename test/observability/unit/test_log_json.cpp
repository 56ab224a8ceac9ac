/***
 * Name: test_log_json
 * Purpose: Diagnostic line format and JSON text helpers.
 */
#include <gtest/gtest.h>

#include <cmath>
#include <sstream>
#include <string>

#include "observability/JsonWriter.h"
#include "observability/Log.h"

using namespace pybox;

TEST(Log, WritesOnlyWhenEnabled) {
  std::ostringstream sink;
  log::Log::SetStream(&sink);
  log::Log::Enable(false);
  log::Log::Info("hidden");
  log::Log::Enable(true);
  log::Log::Warning("fragment timed out");
  log::Log::Debug("x");
  log::Log::Enable(false);
  log::Log::SetStream(nullptr);
  EXPECT_EQ(sink.str(), "pybox: warning: fragment timed out\npybox: debug: x\n");
}

TEST(Log, LevelNames) {
  EXPECT_STREQ(log::Log::LevelName(log::Log::Level::Error), "error");
  EXPECT_STREQ(log::Log::LevelName(log::Log::Level::Info), "info");
}

TEST(Json, EscapeControlAndQuotes) {
  EXPECT_EQ(json::Escape("a\"b\\c\n\t"), "a\\\"b\\\\c\\n\\t");
  EXPECT_EQ(json::Escape(std::string("\x01", 1)), "\\u0001");
  EXPECT_EQ(json::Escape("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(Json, NumberShortestForm) {
  EXPECT_EQ(json::Number(0.5), "0.5");
  EXPECT_EQ(json::Number(3.0), "3.0");
  EXPECT_EQ(json::Number(0.1), "0.1");
  EXPECT_EQ(json::Number(1e20), "1e+20");
  EXPECT_EQ(json::Number(std::nan("")), "null");
}
