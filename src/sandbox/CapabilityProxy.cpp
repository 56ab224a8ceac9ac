/***
 * Name: pybox::sandbox::CapabilityProxy (impl)
 * Purpose: Forward calls to the handle, format and record action calls, translate failures.
 */
#include "sandbox/CapabilityProxy.h"

#include <algorithm>
#include <array>
#include <exception>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "observability/Metrics.h"
#include "pybox/exceptions/pybox_exception.h"
#include "runtime/Callable.h"
#include "runtime/Heap.h"
#include "runtime/Objects.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/Text.h"
#include "sandbox/ActionCatalog.h"

namespace pybox::sandbox {

using rt::Value;

namespace {

constexpr std::size_t kSendKeysPreview = 5;
constexpr long long kDefaultExploreSteps = 500;

bool oneOf(const std::string& name, std::initializer_list<std::string_view> names) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

// `.name` of an enum-like argument, otherwise str().
std::string directionText(rt::Interpreter& interp, const Value& v) {
  if (v.as<rt::EnumMember>() != nullptr) {
    if (auto name = interp.findAttr(v, "name")) { return rt::str(*name); }
  }
  return rt::str(v);
}

std::string sendKeysText(const Value& keys) {
  const auto* s = keys.as<rt::StrObj>();
  if (s == nullptr) { return rt::repr(keys); }
  const std::u32string cps = rt::text::decode(s->value);
  if (cps.size() <= kSendKeysPreview) { return rt::reprString(s->value); }
  return rt::reprString(rt::text::encode(std::u32string_view(cps).substr(0, kSendKeysPreview)) + "...");
}

// First truthy attribute among the failure-detail fields, in priority order.
std::string failureDetail(rt::Interpreter& interp, const Value& result) {
  if (auto error = interp.findAttr(result, "error"); error && rt::truthy(*error)) { return rt::str(*error); }
  if (auto messages = interp.findAttr(result, "messages"); messages && rt::truthy(*messages)) {
    std::string joined;
    bool first = true;
    interp.iterate(*messages, [&](const Value& m) {
      if (!first) { joined += "; "; }
      first = false;
      joined += rt::str(m);
      return true;
    });
    return joined;
  }
  if (auto message = interp.findAttr(result, "message"); message && rt::truthy(*message)) { return rt::str(*message); }
  if (auto reason = interp.findAttr(result, "stop_reason"); reason && rt::truthy(*reason)) {
    return "stopped: " + rt::str(*reason);
  }
  return "failed";
}

rt::TypePtr proxyType() {
  static const rt::TypePtr type = std::make_shared<rt::TypeObject>("NetHackAPI", rt::builtinTypes().object);
  return type;
}

} // namespace

std::string translateError(const std::string& raw, const std::string& method) {
  const std::array<std::pair<std::string_view, std::string>, 6> translations{{
      {"ord() expected a character",
       "Invalid item letter for " + method +
           "(). Use single char like 'a', not a string. For eating from ground, use nh.eat() with no arguments."},
      {"expected str of length 1",
       "Invalid argument to " + method + "(). Expected single character (e.g., 'a'), got string."},
      {"No path through explored territory",
       "Path goes through unexplored areas. Explore corridors/rooms between you and target first."},
      {"Hostile monsters in view",
       "Cannot pathfind while hostiles visible. Fight or flee first. (Note: move_to() ignores this check)"},
      {"is not walkable", "Target position is blocked (wall, boulder, closed door, or monster)."},
      {"item_letter must be a single character",
       "Use a single inventory letter like 'a', not a full name. For eating from ground, use nh.eat() with no "
       "arguments."},
  }};
  for (const auto& [pattern, hint] : translations) {
    if (raw.find(pattern) != std::string::npos) { return hint; }
  }
  return raw;
}

std::string formatArguments(rt::Interpreter& interp, const std::string& method, const rt::CallArgs& args) {
  const rt::ValueList& pos = args.positional;
  if (method == "autoexplore") {
    for (const auto& [name, value] : args.keywords) {
      if (name == "max_steps") { return "max_steps=" + rt::str(value); }
    }
    return "max_steps=" + std::to_string(kDefaultExploreSteps);
  }
  if (pos.empty()) { return ""; }
  if (oneOf(method, {"move", "attack", "kick", "open_door", "close_door"})) { return directionText(interp, pos[0]); }
  if (oneOf(method, {"eat", "quaff", "read", "wear", "wield", "drop", "take_off", "apply"})) {
    return "'" + rt::str(pos[0]) + "'";
  }
  if (oneOf(method, {"zap", "throw"})) {
    if (pos.size() < 2) { return ""; }
    return "'" + rt::str(pos[0]) + "', " + directionText(interp, pos[1]);
  }
  if (method == "move_to") {
    auto x = interp.findAttr(pos[0], "x");
    auto y = interp.findAttr(pos[0], "y");
    if (x && y) { return "(" + rt::str(*x) + ", " + rt::str(*y) + ")"; }
    return rt::str(pos[0]);
  }
  if (method == "travel_to") { return "'" + rt::str(pos[0]) + "'"; }
  if (method == "send_keys") { return sendKeysText(pos[0]); }
  return "";
}

rt::TypePtr CapabilityProxy::type() const { return proxyType(); }

std::optional<Value> CapabilityProxy::getAttr(rt::Interpreter& interp, const Value& self, const std::string& name) {
  if (handle_.hasMethod(name)) {
    return rt::make<rt::BuiltinFunction>(name, [self, name](rt::Interpreter& in, rt::CallArgs& args) {
      return self.as<CapabilityProxy>()->call(in, name, std::move(args));
    }, self);
  }
  return handle_.property(interp, name);
}

std::vector<std::string> CapabilityProxy::attrNames() const {
  std::vector<std::string> names = handle_.methodNames();
  for (auto& p : handle_.propertyNames()) { names.push_back(std::move(p)); }
  return names;
}

Value CapabilityProxy::call(rt::Interpreter& interp, const std::string& method, rt::CallArgs args) {
  if (deadline_ != nullptr) { deadline_->check(); }
  interp.poll();
  const bool tracked = isActionMethod(method);
  std::string formatted = tracked ? formatArguments(interp, method, args) : std::string();

  Value result;
  try {
    result = handle_.invoke(interp, method, args);
  } catch (const exceptions::PyboxException&) {
    throw;
  } catch (const std::exception& e) {
    rt::raise(rt::builtinTypes().runtimeError, e.what());
  }

  if (tracked) { record(interp, method, std::move(formatted), result); }
  return result;
}

void CapabilityProxy::record(rt::Interpreter& interp, const std::string& method, std::string formattedArgs,
                             const Value& result) {
  if (method == kExplorationMethod) {
    if (auto reason = interp.findAttr(result, "stop_reason")) {
      ExplorationOutcome outcome;
      outcome.stopReason = rt::str(*reason);
      if (auto steps = interp.findAttr(result, "steps_taken"); steps && steps->isIntegral()) {
        outcome.stepsTaken = steps->asInt();
      }
      if (auto message = interp.findAttr(result, "message")) { outcome.message = rt::str(*message); }
      exploration_ = std::move(outcome);
    }
  }

  APICallRecord rec;
  rec.method = method;
  rec.formattedArgs = std::move(formattedArgs);
  if (auto success = interp.findAttr(result, "success")) {
    rec.success = rt::truthy(*success);
    if (!rec.success) { rec.error = translateError(failureDetail(interp, result), method); }
  }
  calls_.push_back(std::move(rec));
  metrics::Metrics::Increment(metrics::Metrics::kApiCalls);
}

} // namespace pybox::sandbox
