/***
 * Name: pybox::rt::Value
 * Purpose: Tagged value used by the interpreter for every script-visible datum.
 * Theory of Operation:
 *   None, bool, int and float are stored inline; everything else is a shared
 *   pointer to an Object. A null object pointer collapses to None.
 */
#pragma once

#include <concepts>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pybox::rt {

struct Object;
using ObjectPtr = std::shared_ptr<Object>;

class Value {
 public:
  Value() = default;
  Value(ObjectPtr obj) { // NOLINT(google-explicit-constructor)
    if (obj) { v_ = std::move(obj); }
  }
  template <typename T>
    requires std::derived_from<T, Object>
  Value(std::shared_ptr<T> obj) : Value(ObjectPtr(std::move(obj))) {} // NOLINT(google-explicit-constructor)

  static Value none() { return {}; }
  static Value boolean(bool b) { Value v; v.v_ = b; return v; }
  static Value integer(long long i) { Value v; v.v_ = i; return v; }
  static Value real(double d) { Value v; v.v_ = d; return v; }

  bool isNone() const { return std::holds_alternative<std::monostate>(v_); }
  bool isBool() const { return std::holds_alternative<bool>(v_); }
  bool isInt() const { return std::holds_alternative<long long>(v_); }
  bool isFloat() const { return std::holds_alternative<double>(v_); }
  bool isObject() const { return std::holds_alternative<ObjectPtr>(v_); }
  // bool participates in int arithmetic.
  bool isIntegral() const { return isInt() || isBool(); }
  bool isNumber() const { return isIntegral() || isFloat(); }

  bool asBool() const { return std::get<bool>(v_); }
  long long asInt() const { return isBool() ? (std::get<bool>(v_) ? 1 : 0) : std::get<long long>(v_); }
  double asFloat() const { return isFloat() ? std::get<double>(v_) : static_cast<double>(asInt()); }
  const ObjectPtr& object() const { return std::get<ObjectPtr>(v_); }

  template <typename T>
  T* as() const {
    if (const auto* p = std::get_if<ObjectPtr>(&v_)) { return dynamic_cast<T*>(p->get()); }
    return nullptr;
  }

  template <typename T>
  std::shared_ptr<T> share() const {
    if (const auto* p = std::get_if<ObjectPtr>(&v_)) { return std::dynamic_pointer_cast<T>(*p); }
    return nullptr;
  }

  // Identity, as tested by `is`.
  bool identical(const Value& other) const {
    if (v_.index() != other.v_.index()) { return false; }
    if (isObject()) { return object().get() == other.object().get(); }
    return v_ == other.v_;
  }

 private:
  std::variant<std::monostate, bool, long long, double, ObjectPtr> v_{};
};

using ValueList = std::vector<Value>;

// Drops every value in `refs`. Objects that die as a result hand their own
// references to the same worklist, so a deeply nested chain is freed in a
// loop instead of through nested destructors.
void releaseIteratively(ValueList& refs) noexcept;

// Positional and keyword arguments of one call.
struct CallArgs {
  ValueList positional;
  std::vector<std::pair<std::string, Value>> keywords;
};

} // namespace pybox::rt
