/***
 * Name: pybox::sandbox domain types (impl)
 * Purpose: Build the Direction/Position/HungerState/SkillResult types and their instances.
 */
#include "sandbox/DomainTypes.h"

#include <array>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "runtime/Callable.h"
#include "runtime/Heap.h"
#include "runtime/Interpreter.h"
#include "runtime/Objects.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/detail/ArgReader.h"

namespace pybox::sandbox {

using rt::CallArgs;
using rt::Interpreter;
using rt::Value;
using rt::detail::ArgReader;

namespace {

struct DirectionSpec {
  const char* name;
  const char* value;
  long long dx;
  long long dy;
};

constexpr std::array<DirectionSpec, 11> kDirections{{
    {"N", "n", 0, -1},
    {"S", "s", 0, 1},
    {"E", "e", 1, 0},
    {"W", "w", -1, 0},
    {"NE", "ne", 1, -1},
    {"NW", "nw", -1, -1},
    {"SE", "se", 1, 1},
    {"SW", "sw", -1, 1},
    {"UP", "up", 0, 0},
    {"DOWN", "down", 0, 0},
    {"SELF", "self", 0, 0},
}};

constexpr std::array<std::pair<const char*, const char*>, 6> kHungerStates{{
    {"SATIATED", "Satiated"},
    {"NOT_HUNGRY", "Not Hungry"},
    {"HUNGRY", "Hungry"},
    {"WEAK", "Weak"},
    {"FAINTING", "Fainting"},
    {"FAINTED", "Fainted"},
}};

const rt::BuiltinTypes& types() { return rt::builtinTypes(); }

// Process-lifetime string; not tracked by any interpreter heap.
Value staticStr(const char* s) { return Value(std::make_shared<rt::StrObj>(s)); }

// Enum(value): the member whose value equals the argument.
Value enumByValue(const rt::TypeObject& type, CallArgs& args) {
  ArgReader r(type.name, args);
  r.noKeywords();
  r.expect(1, 1);
  const Value& wanted = r.at(0);
  for (const auto& [name, member] : type.members) {
    const auto* m = member.as<rt::EnumMember>();
    if (m == nullptr) { continue; }
    if (member.identical(wanted) || rt::equals(m->value(), wanted)) { return member; }
  }
  rt::raise(types().valueError, rt::repr(wanted) + " is not a valid " + type.name);
}

const PositionObj& positionArg(const Value& v, const char* method) {
  const auto* p = v.as<PositionObj>();
  if (p == nullptr) {
    rt::raise(types().typeError, std::string(method) + "() argument must be Position, not " + rt::typeName(v));
  }
  return *p;
}

Value constructPosition(Interpreter&, CallArgs& args) {
  ArgReader r("Position", args);
  auto x = r.argument(0, "x");
  auto y = r.argument(1, "y");
  r.finish();
  r.expect(0, 2);
  if (!x || !y) {
    rt::raise(types().typeError, std::string("Position.__init__() missing required argument: '") + (x ? "y" : "x") + "'");
  }
  return makePosition(rt::detail::toInteger(*x), rt::detail::toInteger(*y));
}

Value newSkillResult(const Value& reason, const std::optional<Value>& data, long long actions, long long turns,
                     bool success) {
  std::string stopped = reason.as<rt::StrObj>() != nullptr ? reason.as<rt::StrObj>()->value : rt::str(reason);
  Value fields = data && !data->isNone() ? *data : rt::newDict();
  if (fields.as<rt::DictObj>() == nullptr) {
    rt::raise(types().typeError, "SkillResult data must be a dict, not " + rt::typeName(fields));
  }
  return rt::make<SkillResultObj>(std::move(stopped), std::move(fields), actions, turns, success);
}

Value constructSkillResult(Interpreter&, CallArgs& args) {
  ArgReader r("SkillResult", args);
  auto reason = r.argument(0, "stopped_reason");
  auto data = r.argument(1, "data");
  auto actions = r.argument(2, "actions_taken");
  auto turns = r.argument(3, "turns_elapsed");
  auto success = r.argument(4, "success");
  r.finish();
  r.expect(0, 5);
  if (!reason) {
    rt::raise(types().typeError, "SkillResult.__init__() missing 1 required positional argument: 'stopped_reason'");
  }
  return newSkillResult(*reason, data, actions ? rt::detail::toInteger(*actions) : 0,
                        turns ? rt::detail::toInteger(*turns) : 0, success ? rt::truthy(*success) : false);
}

// SkillResult.stopped(reason, success=False, actions=0, turns=0, **data)
Value skillResultStopped(Interpreter&, CallArgs& args) {
  ArgReader r("stopped", args);
  auto reason = r.argument(0, "reason");
  auto success = r.argument(1, "success");
  auto actions = r.argument(2, "actions");
  auto turns = r.argument(3, "turns");
  r.expect(0, 4);
  if (!reason) { rt::raise(types().typeError, "stopped() missing 1 required positional argument: 'reason'"); }
  Value data = rt::newDict();
  auto& table = data.as<rt::DictObj>()->table;
  for (auto& [key, value] : args.keywords) { table.insert(rt::newStr(key), value); }
  args.keywords.clear();
  return newSkillResult(*reason, data, actions ? rt::detail::toInteger(*actions) : 0,
                        turns ? rt::detail::toInteger(*turns) : 0, success ? rt::truthy(*success) : false);
}

DomainTypes buildDomainTypes() {
  const rt::TypePtr& object = types().object;
  DomainTypes out;

  out.direction = std::make_shared<rt::TypeObject>("Direction", object);
  out.direction->isEnum = true;
  const rt::TypeObject* directionType = out.direction.get();
  out.direction->construct = [directionType](Interpreter&, CallArgs& args) { return enumByValue(*directionType, args); };
  for (const auto& spec : kDirections) {
    auto member = std::make_shared<rt::EnumMember>(out.direction, spec.name, staticStr(spec.value));
    member->setExtra("delta", Value(std::make_shared<rt::TupleObj>(
                                  rt::ValueList{Value::integer(spec.dx), Value::integer(spec.dy)})));
    out.direction->members.emplace_back(spec.name, Value(member));
  }

  out.hungerState = std::make_shared<rt::TypeObject>("HungerState", object);
  out.hungerState->isEnum = true;
  const rt::TypeObject* hungerType = out.hungerState.get();
  out.hungerState->construct = [hungerType](Interpreter&, CallArgs& args) { return enumByValue(*hungerType, args); };
  for (const auto& [name, value] : kHungerStates) {
    out.hungerState->members.emplace_back(
        name, Value(std::make_shared<rt::EnumMember>(out.hungerState, name, staticStr(value))));
  }

  out.position = std::make_shared<rt::TypeObject>("Position", object, &constructPosition);

  out.skillResult = std::make_shared<rt::TypeObject>("SkillResult", object, &constructSkillResult);
  out.skillResult->members.emplace_back(
      "stopped", Value(std::make_shared<rt::BuiltinFunction>("SkillResult.stopped", &skillResultStopped)));
  return out;
}

Value boundMethod(const Value& self, const char* name, rt::NativeFn fn) {
  return rt::make<rt::BuiltinFunction>(name, std::move(fn), self);
}

} // namespace

const DomainTypes& domainTypes() {
  static const DomainTypes instance = buildDomainTypes();
  return instance;
}

Value direction(const std::string& name) {
  if (const Value* member = domainTypes().direction->findMember(name)) { return *member; }
  return Value();
}

std::optional<std::pair<long long, long long>> directionDelta(const Value& v) {
  const auto* member = v.as<rt::EnumMember>();
  if (member == nullptr || member->type() != domainTypes().direction) { return std::nullopt; }
  for (const auto& spec : kDirections) {
    if (member->name() == spec.name) { return std::make_pair(spec.dx, spec.dy); }
  }
  return std::nullopt;
}

Value makePosition(long long x, long long y) { return rt::make<PositionObj>(x, y); }

long long PositionObj::distanceTo(const PositionObj& other) const {
  const long long dx = x_ > other.x_ ? x_ - other.x_ : other.x_ - x_;
  const long long dy = y_ > other.y_ ? y_ - other.y_ : other.y_ - y_;
  return dx > dy ? dx : dy;
}

Value PositionObj::directionTo(const PositionObj& other) const {
  auto sign = [](long long d) { return d == 0 ? 0LL : (d > 0 ? 1LL : -1LL); };
  const long long dx = sign(other.x_ - x_);
  const long long dy = sign(other.y_ - y_);
  if (dx == 0 && dy == 0) { return direction("SELF"); }
  for (const auto& spec : kDirections) {
    if (spec.dx == dx && spec.dy == dy) { return direction(spec.name); }
  }
  return Value();
}

std::optional<Value> PositionObj::getAttr(Interpreter& interp, const Value& self, const std::string& name) {
  (void)interp;
  if (name == "x") { return Value::integer(x_); }
  if (name == "y") { return Value::integer(y_); }
  if (name == "distance_to" || name == "chebyshev_distance") {
    const std::string method = name;
    return boundMethod(self, "distance_to", [self, method](Interpreter&, CallArgs& args) {
      ArgReader r(method, args);
      r.noKeywords();
      r.expect(1, 1);
      return Value::integer(self.as<PositionObj>()->distanceTo(positionArg(r.at(0), method.c_str())));
    });
  }
  if (name == "direction_to") {
    return boundMethod(self, "direction_to", [self](Interpreter&, CallArgs& args) {
      ArgReader r("direction_to", args);
      r.noKeywords();
      r.expect(1, 1);
      return self.as<PositionObj>()->directionTo(positionArg(r.at(0), "direction_to"));
    });
  }
  if (name == "adjacent") {
    return boundMethod(self, "adjacent", [self](Interpreter&, CallArgs& args) {
      ArgReader r("adjacent", args);
      r.noKeywords();
      r.expect(0, 0);
      const auto* p = self.as<PositionObj>();
      rt::ValueList out;
      for (long long dx = -1; dx <= 1; ++dx) {
        for (long long dy = -1; dy <= 1; ++dy) {
          if (dx == 0 && dy == 0) { continue; }
          out.push_back(makePosition(p->x() + dx, p->y() + dy));
        }
      }
      return rt::newList(std::move(out));
    });
  }
  if (name == "move") {
    return boundMethod(self, "move", [self](Interpreter&, CallArgs& args) {
      ArgReader r("move", args);
      auto dir = r.argument(0, "direction");
      r.finish();
      r.expect(0, 1);
      if (!dir) { rt::raise(types().typeError, "move() missing 1 required positional argument: 'direction'"); }
      const auto delta = directionDelta(*dir);
      if (!delta) { rt::raise(types().typeError, "move() argument must be Direction, not " + rt::typeName(*dir)); }
      const auto* p = self.as<PositionObj>();
      return makePosition(rt::checkedAdd(p->x(), delta->first), rt::checkedAdd(p->y(), delta->second));
    });
  }
  return std::nullopt;
}

std::vector<std::string> PositionObj::attrNames() const {
  return {"adjacent", "chebyshev_distance", "direction_to", "distance_to", "move", "x", "y"};
}

std::string PositionObj::repr() const {
  return "Position(x=" + std::to_string(x_) + ", y=" + std::to_string(y_) + ")";
}

bool PositionObj::equals(const rt::NativeObject& other) const {
  const auto* p = dynamic_cast<const PositionObj*>(&other);
  return p != nullptr && p->x_ == x_ && p->y_ == y_;
}

std::size_t PositionObj::hash() const {
  const std::size_t hx = std::hash<long long>{}(x_);
  return hx ^ (std::hash<long long>{}(y_) + 0x9e3779b97f4a7c15ULL + (hx << 6U) + (hx >> 2U));
}

std::optional<Value> PositionObj::binaryOp(ast::BinaryOperator op, const Value& other, bool reflected) const {
  if (op != ast::BinaryOperator::Add || reflected) { return std::nullopt; }
  const auto* delta = other.as<rt::TupleObj>();
  if (delta == nullptr || delta->items.size() != 2) { return std::nullopt; }
  return makePosition(rt::checkedAdd(x_, rt::detail::toInteger(delta->items[0])),
                      rt::checkedAdd(y_, rt::detail::toInteger(delta->items[1])));
}

std::optional<int> PositionObj::compare(const rt::NativeObject& other) const {
  const auto* p = dynamic_cast<const PositionObj*>(&other);
  if (p == nullptr) { return std::nullopt; }
  if (x_ != p->x_) { return x_ < p->x_ ? -1 : 1; }
  if (y_ != p->y_) { return y_ < p->y_ ? -1 : 1; }
  return 0;
}

std::optional<Value> SkillResultObj::getAttr(Interpreter& interp, const Value& self, const std::string& name) {
  (void)interp;
  (void)self;
  if (name == "stopped_reason") { return rt::newStr(stoppedReason_); }
  if (name == "data") { return data_; }
  if (name == "actions_taken") { return Value::integer(actionsTaken_); }
  if (name == "turns_elapsed") { return Value::integer(turnsElapsed_); }
  if (name == "success") { return Value::boolean(success_); }
  if (const Value* member = domainTypes().skillResult->findMember(name)) { return *member; }
  return std::nullopt;
}

bool SkillResultObj::setAttr(const std::string& name, const Value& value) {
  if (name == "stopped_reason") {
    stoppedReason_ = value.as<rt::StrObj>() != nullptr ? value.as<rt::StrObj>()->value : rt::str(value);
    return true;
  }
  if (name == "data") {
    if (value.as<rt::DictObj>() == nullptr) {
      rt::raise(types().typeError, "SkillResult data must be a dict, not " + rt::typeName(value));
    }
    data_ = value;
    return true;
  }
  if (name == "actions_taken") {
    actionsTaken_ = rt::detail::toInteger(value);
    return true;
  }
  if (name == "turns_elapsed") {
    turnsElapsed_ = rt::detail::toInteger(value);
    return true;
  }
  if (name == "success") {
    success_ = rt::truthy(value);
    return true;
  }
  return false;
}

std::vector<std::string> SkillResultObj::attrNames() const {
  return {"actions_taken", "data", "stopped", "stopped_reason", "success", "turns_elapsed"};
}

std::string SkillResultObj::repr() const {
  return "SkillResult(stopped_reason=" + rt::reprString(stoppedReason_) + ", data=" + rt::repr(data_) +
         ", actions_taken=" + std::to_string(actionsTaken_) + ", turns_elapsed=" + std::to_string(turnsElapsed_) +
         ", success=" + (success_ ? "True" : "False") + ")";
}

} // namespace pybox::sandbox
