/***
 * Name: pybox::sandbox::filterMessages
 * Purpose: Turn the raw state-change messages of one run into the list reported back.
 * Inputs:
 *   - fresh: history entries added since the run started, oldest first
 *   - current: the message on screen when the run ended (may be empty)
 * Outputs:
 *   - Ordered, de-duplicated messages without transient prompts
 * Theory of Operation:
 *   When more than kMessageWindow messages arrived, keep every message that
 *   mentions a kill ("kill" or "destroy", any case) followed by the last
 *   kMessageWindow messages. Then drop repeats (first occurrence wins), drop
 *   prompts that only make sense mid-action ("What do you want to eat?"),
 *   and put the on-screen message first when it is not already listed.
 */
#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pybox::sandbox {

inline constexpr std::size_t kMessageWindow = 200;

inline constexpr std::array<std::string_view, 16> kTransientPrompts{
    "What do you want to zap?",   "What do you want to read?",     "What do you want to drink?",
    "What do you want to quaff?", "What do you want to eat?",      "What do you want to wear?",
    "What do you want to wield?", "What do you want to take off?", "What do you want to drop?",
    "What do you want to throw?", "What do you want to apply?",    "What do you want to invoke?",
    "What do you want to dip?",   "What do you want to rub?",      "What do you want to write with?",
    "In what direction?"};

// True when the message (ignoring surrounding whitespace) starts with a transient prompt.
bool isTransientPrompt(const std::string& message);

std::vector<std::string> filterMessages(const std::vector<std::string>& fresh, const std::string& current);

} // namespace pybox::sandbox
