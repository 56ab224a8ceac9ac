/***
 * Name: pybox::log::Log (impl)
 * Purpose: Format and emit diagnostic lines.
 */
#include "observability/Log.h"

#include <iostream>
#include <ostream>

namespace pybox {
namespace log {

std::mutex Log::mutex_{};
bool Log::enabled_{false};
std::ostream* Log::out_{nullptr};

void Log::Enable(bool on) {
  std::lock_guard<std::mutex> lock(mutex_);
  enabled_ = on;
}

bool Log::Enabled() {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_;
}

void Log::SetStream(std::ostream* out) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ = out;
}

const char* Log::LevelName(Level level) {
  switch (level) {
    case Level::Debug: return "debug";
    case Level::Info: return "info";
    case Level::Warning: return "warning";
    case Level::Error: return "error";
  }
  return "unknown";
}

void Log::Write(Level level, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enabled_) return;
  std::ostream& out = out_ != nullptr ? *out_ : std::cerr;
  out << "pybox: " << LevelName(level) << ": " << message << '\n';
  out.flush();
}

}  // namespace log
}  // namespace pybox
