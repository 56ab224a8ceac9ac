/***
 * Name: pybox::sandbox::DryRunHandle (impl)
 */
#include "sandbox/DryRunHandle.h"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string_view>
#include <utility>

#include "runtime/Native.h"
#include "runtime/Objects.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/Text.h"
#include "runtime/detail/ArgReader.h"
#include "sandbox/ActionCatalog.h"
#include "sandbox/DomainTypes.h"

namespace pybox::sandbox {

using rt::Value;

namespace {

constexpr long long kExploreSteps = 12;
constexpr long long kDefaultExploreSteps = 500;

constexpr std::array<std::string_view, 9> kQueries{
    "get_position",        "get_message",          "get_messages",         "get_stats",   "get_inventory",
    "get_visible_monsters", "get_hostile_monsters", "get_adjacent_hostiles", "find_stairs"};

constexpr std::array<std::string_view, 8> kItemActions{"eat",  "quaff", "read",     "wear",
                                                       "wield", "drop", "take_off", "apply"};

constexpr std::array<std::string_view, 5> kDirectedActions{"move", "attack", "kick", "open_door", "close_door"};

// Actions that only answer a prompt or inspect; they spend no game time.
constexpr std::array<std::string_view, 5> kFreeActions{"look", "escape", "confirm", "deny", "space"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& names, std::string_view name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

Value failure(const std::string& error) {
  return rt::makeRecord("ActionResult", {{"success", Value::boolean(false)},
                                         {"messages", rt::newList()},
                                         {"turn_elapsed", Value::boolean(false)},
                                         {"state_changed", Value::boolean(false)},
                                         {"error", rt::newStr(error)}});
}

// Inventory letters are exactly one character.
bool isItemLetter(const Value& v) {
  const auto* s = v.as<rt::StrObj>();
  return s != nullptr && rt::text::decode(s->value).size() == 1;
}

std::pair<long long, long long> requireDirection(const std::string& method, const Value& v) {
  if (auto delta = directionDelta(v)) { return *delta; }
  rt::raise(rt::builtinTypes().typeError,
            method + "() argument must be a Direction, not '" + rt::typeName(v) + "'");
}

} // namespace

bool DryRunHandle::hasMethod(const std::string& name) const {
  return isActionMethod(name) || contains(kQueries, name);
}

std::vector<std::string> DryRunHandle::methodNames() const {
  std::vector<std::string> names;
  for (auto name : kActionMethods) { names.emplace_back(name); }
  names.emplace_back(kExplorationMethod);
  for (auto name : kQueries) { names.emplace_back(name); }
  return names;
}

std::vector<std::string> DryRunHandle::propertyNames() const { return {"turn", "position", "is_done"}; }

std::optional<Value> DryRunHandle::property(rt::Interpreter& /*interp*/, const std::string& name) {
  if (name == "turn") { return Value::integer(turn_); }
  if (name == "position") { return makePosition(x_, y_); }
  if (name == "is_done") { return Value::boolean(false); }
  return std::nullopt;
}

std::vector<std::string> DryRunHandle::messagesSince(std::size_t index) const {
  if (index >= history_.size()) { return {}; }
  return {history_.begin() + static_cast<std::ptrdiff_t>(index), history_.end()};
}

void DryRunHandle::failNext(const std::string& method, std::string error) { failures_[method] = std::move(error); }

void DryRunHandle::raiseNext(const std::string& method, std::string message) { raises_[method] = std::move(message); }

void DryRunHandle::addMessage(std::string message) {
  history_.push_back(message);
  current_ = std::move(message);
}

Value DryRunHandle::invoke(rt::Interpreter& /*interp*/, const std::string& method, rt::CallArgs& args) {
  ++invocations_;
  if (auto it = raises_.find(method); it != raises_.end()) {
    const std::string message = it->second;
    raises_.erase(it);
    rt::raise(rt::builtinTypes().runtimeError, message);
  }
  if (!isActionMethod(method)) { return query(method, args); }
  if (auto it = failures_.find(method); it != failures_.end()) {
    const std::string error = it->second;
    failures_.erase(it);
    if (method == kExplorationMethod) {
      return rt::makeRecord("AutoexploreResult", {{"stop_reason", rt::newStr("no_observation")},
                                                  {"steps_taken", Value::integer(0)},
                                                  {"turns_elapsed", Value::integer(0)},
                                                  {"position", makePosition(x_, y_)},
                                                  {"message", rt::newStr(error)},
                                                  {"success", Value::boolean(false)}});
    }
    return failure(error);
  }
  if (method == kExplorationMethod) { return explore(args); }
  return act(method, args);
}

Value DryRunHandle::succeed(long long turns, std::vector<std::string> messages) {
  turn_ += turns;
  rt::ValueList items;
  for (auto& m : messages) {
    items.push_back(rt::newStr(m));
    addMessage(std::move(m));
  }
  return rt::makeRecord("ActionResult", {{"success", Value::boolean(true)},
                                         {"messages", rt::newList(std::move(items))},
                                         {"turn_elapsed", Value::boolean(turns > 0)},
                                         {"state_changed", Value::boolean(true)},
                                         {"error", Value()}});
}

Value DryRunHandle::act(const std::string& method, rt::CallArgs& args) {
  rt::detail::ArgReader reader(method, args);

  if (contains(kDirectedActions, method)) {
    reader.expect(1, 1);
    reader.finish();
    const auto [dx, dy] = requireDirection(method, reader.at(0));
    if (method == "move") {
      x_ += dx;
      y_ += dy;
    }
    return succeed(1);
  }

  if (contains(kItemActions, method)) {
    reader.expect(0, 1);
    std::optional<Value> letter = reader.argument(0, "item_letter");
    reader.finish();
    if (!letter) {
      if (method == "eat") { return succeed(1, {"This food is delicious!"}); }
      return failure("item_letter must be a single character");
    }
    if (!isItemLetter(*letter)) { return failure("item_letter must be a single character"); }
    return succeed(1);
  }

  if (method == "zap" || method == "throw") {
    reader.expect(2, 2);
    reader.finish();
    if (!isItemLetter(reader.at(0))) { return failure("item_letter must be a single character"); }
    requireDirection(method, reader.at(1));
    return succeed(1);
  }

  if (method == "move_to") {
    reader.expect(1, 1);
    reader.finish();
    const auto* target = reader.at(0).as<PositionObj>();
    if (target == nullptr) {
      rt::raise(rt::builtinTypes().typeError,
                "move_to() argument must be a Position, not '" + rt::typeName(reader.at(0)) + "'");
    }
    const long long steps = std::max(std::llabs(target->x() - x_), std::llabs(target->y() - y_));
    x_ = target->x();
    y_ = target->y();
    return succeed(std::max(steps, 1LL));
  }

  if (method == "go_up" || method == "go_down") {
    reader.expect(0, 0);
    reader.finish();
    depth_ += method == "go_down" ? 1 : -1;
    return succeed(1);
  }

  if (method == "travel_to" || method == "send_keys" || method == "send_action") {
    reader.expect(1, 1);
    reader.finish();
    reader.string(0);
    return succeed(1);
  }

  if (method == "search" || method == "rest") {
    reader.expect(0, 1);
    std::optional<Value> count = reader.argument(0, "count");
    reader.finish();
    return succeed(count ? std::max(rt::detail::toInteger(*count), 1LL) : 1);
  }

  if (method == "pray") { return succeed(3, {"You begin praying to the gods."}); }

  return succeed(contains(kFreeActions, method) ? 0 : 1);
}

Value DryRunHandle::explore(rt::CallArgs& args) {
  rt::detail::ArgReader reader(std::string(kExplorationMethod), args);
  reader.expect(0, 1);
  std::optional<Value> maxSteps = reader.argument(0, "max_steps");
  reader.finish();
  const long long limit = maxSteps ? rt::detail::toInteger(*maxSteps) : kDefaultExploreSteps;
  const long long steps = std::clamp(limit, 0LL, kExploreSteps);
  const bool finished = steps == kExploreSteps;
  turn_ += steps;
  return rt::makeRecord("AutoexploreResult",
                        {{"stop_reason", rt::newStr(finished ? "fully_explored" : "max_steps")},
                         {"steps_taken", Value::integer(steps)},
                         {"turns_elapsed", Value::integer(steps)},
                         {"position", makePosition(x_, y_)},
                         {"message", rt::newStr(finished ? "Level fully explored." : "Step limit reached.")},
                         {"success", Value::boolean(true)}});
}

Value DryRunHandle::stats() const {
  Value hunger;
  if (const Value* member = domainTypes().hungerState->findMember("NOT_HUNGRY")) { hunger = *member; }
  return rt::makeRecord("Stats", {{"hp", Value::integer(16)},
                                  {"max_hp", Value::integer(16)},
                                  {"dungeon_level", Value::integer(depth_)},
                                  {"turn", Value::integer(turn_)},
                                  {"hunger", hunger},
                                  {"position", makePosition(x_, y_)}});
}

Value DryRunHandle::query(const std::string& method, rt::CallArgs& args) {
  rt::detail::ArgReader reader(method, args);
  if (method == "get_messages") {
    reader.expect(0, 1);
    std::optional<Value> n = reader.argument(0, "n");
    reader.finish();
    const long long wanted = n ? rt::detail::toInteger(*n) : 10;
    const std::size_t count = std::min(history_.size(), static_cast<std::size_t>(std::max(wanted, 0LL)));
    rt::ValueList items;
    for (std::size_t i = history_.size() - count; i < history_.size(); ++i) { items.push_back(rt::newStr(history_[i])); }
    return rt::newList(std::move(items));
  }

  reader.expect(0, 0);
  reader.finish();
  if (method == "get_position") { return makePosition(x_, y_); }
  if (method == "get_message") { return rt::newStr(current_); }
  if (method == "get_stats") { return stats(); }
  if (method == "find_stairs") { return rt::newTuple({Value(), Value()}); }
  // Inventory and monster queries: nothing is ever there.
  return rt::newList();
}

} // namespace pybox::sandbox
