/***
 * Name: pybox::sandbox domain types
 * Purpose: Value types a fragment namespace carries for talking to the game:
 *   Direction, Position, HungerState and SkillResult.
 * Theory of Operation:
 *   The type objects and the enumeration members are built once per process
 *   with plain shared pointers, outside any interpreter heap, so teardown of
 *   one execution never clears them. Position and SkillResult instances are
 *   ordinary per-execution objects.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "runtime/Native.h"
#include "runtime/TypeObject.h"
#include "runtime/Value.h"

namespace pybox::sandbox {

struct DomainTypes {
  rt::TypePtr direction;
  rt::TypePtr position;
  rt::TypePtr hungerState;
  rt::TypePtr skillResult;
};

const DomainTypes& domainTypes();

// Direction member by enum name ("N", "SE"); None when unknown.
rt::Value direction(const std::string& name);
// (dx, dy) of a Direction member; nullopt for any other value.
std::optional<std::pair<long long, long long>> directionDelta(const rt::Value& v);

class PositionObj final : public rt::NativeObject {
 public:
  PositionObj(long long x, long long y) : x_(x), y_(y) {}

  rt::TypePtr type() const override { return domainTypes().position; }
  std::optional<rt::Value> getAttr(rt::Interpreter& interp, const rt::Value& self, const std::string& name) override;
  std::vector<std::string> attrNames() const override;
  std::string repr() const override;
  bool equals(const rt::NativeObject& other) const override;
  std::size_t hash() const override;
  std::optional<rt::Value> binaryOp(ast::BinaryOperator op, const rt::Value& other, bool reflected) const override;
  std::optional<int> compare(const rt::NativeObject& other) const override;

  long long x() const { return x_; }
  long long y() const { return y_; }
  // Chebyshev distance: moves needed with 8-directional movement.
  long long distanceTo(const PositionObj& other) const;
  rt::Value directionTo(const PositionObj& other) const;

 private:
  long long x_;
  long long y_;
};

rt::Value makePosition(long long x, long long y);

/***
 * Name: pybox::sandbox::SkillResultObj
 * Purpose: Structured outcome a named fragment returns.
 * Theory of Operation:
 *   Mutable like the record it models: fragments may assign the five
 *   fields after construction. `data` is always a dict.
 */
class SkillResultObj final : public rt::NativeObject {
 public:
  SkillResultObj(std::string stoppedReason, rt::Value data, long long actionsTaken, long long turnsElapsed,
                 bool success)
      : stoppedReason_(std::move(stoppedReason)),
        data_(std::move(data)),
        actionsTaken_(actionsTaken),
        turnsElapsed_(turnsElapsed),
        success_(success) {}

  rt::TypePtr type() const override { return domainTypes().skillResult; }
  std::optional<rt::Value> getAttr(rt::Interpreter& interp, const rt::Value& self, const std::string& name) override;
  bool setAttr(const std::string& name, const rt::Value& value) override;
  std::vector<std::string> attrNames() const override;
  std::string repr() const override;
  void releaseReferences() override { data_ = rt::Value(); }

  const std::string& stoppedReason() const { return stoppedReason_; }
  const rt::Value& data() const { return data_; }
  long long actionsTaken() const { return actionsTaken_; }
  long long turnsElapsed() const { return turnsElapsed_; }
  bool success() const { return success_; }

 private:
  std::string stoppedReason_;
  rt::Value data_;
  long long actionsTaken_;
  long long turnsElapsed_;
  bool success_;
};

} // namespace pybox::sandbox
