/***
 * Name: pybox::sandbox::ActionCatalog
 * Purpose: The fixed set of capability methods that count as actions.
 * Theory of Operation:
 *   Calls to these names through the capability proxy produce one
 *   APICallRecord each; every other handle method is a query and passes
 *   through untracked. The validator reads the same table to report which
 *   actions a fragment references.
 */
#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace pybox::sandbox {

inline constexpr std::array<std::string_view, 35> kActionMethods{
    "move",        "move_to",    "go_up",        "go_down",   "attack",   "kick",      "fire",
    "throw",       "pickup",     "drop",         "eat",       "quaff",    "read",      "zap",
    "wear",        "wield",      "take_off",     "apply",     "open_door", "close_door", "wait",
    "search",      "rest",       "pay",          "pray",      "look",     "cast_spell", "engrave",
    "send_keys",   "send_action", "escape",      "confirm",   "deny",     "space",     "travel_to"};

// The exploration action; its outcome is stored apart from the call records.
inline constexpr std::string_view kExplorationMethod = "autoexplore";

inline bool isActionMethod(std::string_view name) {
  if (name == kExplorationMethod) return true;
  return std::find(kActionMethods.begin(), kActionMethods.end(), name) != kActionMethods.end();
}

} // namespace pybox::sandbox
