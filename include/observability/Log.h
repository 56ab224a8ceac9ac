/***
 * Name: pybox::log::Log
 * Purpose: Process-wide diagnostic sink for the CLI, validator and sandbox.
 * Inputs: Severity and message text
 * Outputs: Lines of the form "pybox: <level>: <message>" on the sink stream
 * Theory of Operation: Static state like the metrics registry. Disabled by
 *   default (the CLI enables it with --verbose); errors that end a command
 *   are printed by the CLI directly and do not pass through here. A mutex
 *   keeps lines from concurrent sandboxes whole.
 */
#pragma once

#include <iosfwd>
#include <mutex>
#include <string>

namespace pybox {
namespace log {

class Log {
 public:
  enum class Level { Debug, Info, Warning, Error };

  static void Enable(bool on);
  static bool Enabled();
  // Redirect output; nullptr restores std::cerr.
  static void SetStream(std::ostream* out);

  static void Write(Level level, const std::string& message);
  static void Debug(const std::string& message) { Write(Level::Debug, message); }
  static void Info(const std::string& message) { Write(Level::Info, message); }
  static void Warning(const std::string& message) { Write(Level::Warning, message); }
  static void Error(const std::string& message) { Write(Level::Error, message); }

  static const char* LevelName(Level level);

 private:
  static std::mutex mutex_;
  static bool enabled_;
  static std::ostream* out_;
};

}  // namespace log
}  // namespace pybox
