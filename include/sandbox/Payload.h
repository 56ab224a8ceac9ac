/***
 * Name: pybox::sandbox::PayloadValue
 * Purpose: Interpreter-independent structured value for submission parameters and result payloads.
 * Inputs: Script values (toPayload) or host values (constructors)
 * Outputs: JSON text, Python-literal text, script values (fromPayload)
 * Theory of Operation:
 *   A payload outlives the interpreter that produced it, so it owns plain
 *   C++ data only. Maps keep insertion order. Conversion from script values
 *   flattens list/tuple/set into lists, dicts into maps (keys rendered with
 *   str()), SkillResult and records into maps, and anything else into its
 *   repr(). A container that contains itself is rendered as "[...]"/"{...}";
 *   nesting deeper than 1000 levels is cut to "...".
 */
#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "runtime/Value.h"

namespace pybox::sandbox {

class PayloadValue {
 public:
  using List = std::vector<PayloadValue>;
  using Map = std::vector<std::pair<std::string, PayloadValue>>;

  PayloadValue() = default;
  PayloadValue(bool b) : v_(b) {}                        // NOLINT(google-explicit-constructor)
  PayloadValue(int i) : v_(static_cast<long long>(i)) {} // NOLINT(google-explicit-constructor)
  PayloadValue(long long i) : v_(i) {}                   // NOLINT(google-explicit-constructor)
  PayloadValue(double d) : v_(d) {}                      // NOLINT(google-explicit-constructor)
  PayloadValue(std::string s) : v_(std::move(s)) {}      // NOLINT(google-explicit-constructor)
  PayloadValue(const char* s) : v_(std::string(s)) {}    // NOLINT(google-explicit-constructor)
  PayloadValue(List l) : v_(std::move(l)) {}             // NOLINT(google-explicit-constructor)
  PayloadValue(Map m) : v_(std::move(m)) {}              // NOLINT(google-explicit-constructor)

  bool isNone() const { return std::holds_alternative<std::monostate>(v_); }
  bool isBool() const { return std::holds_alternative<bool>(v_); }
  bool isInt() const { return std::holds_alternative<long long>(v_); }
  bool isFloat() const { return std::holds_alternative<double>(v_); }
  bool isString() const { return std::holds_alternative<std::string>(v_); }
  bool isList() const { return std::holds_alternative<List>(v_); }
  bool isMap() const { return std::holds_alternative<Map>(v_); }

  bool asBool() const { return std::get<bool>(v_); }
  long long asInt() const { return std::get<long long>(v_); }
  double asFloat() const { return std::get<double>(v_); }
  const std::string& asString() const { return std::get<std::string>(v_); }
  const List& asList() const { return std::get<List>(v_); }
  const Map& asMap() const { return std::get<Map>(v_); }
  Map& asMap() { return std::get<Map>(v_); }

  // Entry of a map by key; nullptr when absent or not a map.
  const PayloadValue* find(const std::string& key) const;
  // Replace or append a map entry.
  void set(const std::string& key, PayloadValue value);

  std::string toJson() const;
  // Python literal rendering: None, True, 'text', [..], {'k': v}.
  std::string toText() const;

  friend bool operator==(const PayloadValue& a, const PayloadValue& b) { return a.v_ == b.v_; }

 private:
  std::variant<std::monostate, bool, long long, double, std::string, List, Map> v_{};
};

PayloadValue toPayload(const rt::Value& v);
// Needs an active interpreter heap.
rt::Value fromPayload(const PayloadValue& p);

} // namespace pybox::sandbox
