/***
 * Name: pybox::sandbox::PayloadValue (impl)
 * Purpose: Conversions between script values and payloads; JSON and text rendering.
 */
#include "sandbox/Payload.h"

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "observability/JsonWriter.h"
#include "runtime/Native.h"
#include "runtime/Objects.h"
#include "runtime/Ops.h"
#include "sandbox/DomainTypes.h"

namespace pybox::sandbox {

namespace {

constexpr std::size_t kMaxNesting = 1000;

class Converter {
 public:
  PayloadValue convert(const rt::Value& v) {
    if (v.isNone()) { return {}; }
    if (v.isBool()) { return v.asBool(); }
    if (v.isInt()) { return v.asInt(); }
    if (v.isFloat()) { return v.asFloat(); }
    if (const auto* s = v.as<rt::StrObj>()) { return s->value; }

    if (active_.size() >= kMaxNesting) { return std::string("..."); }
    const rt::Object* obj = v.object().get();
    if (std::find(active_.begin(), active_.end(), obj) != active_.end()) {
      return std::string(v.as<rt::DictObj>() != nullptr ? "{...}" : "[...]");
    }
    active_.push_back(obj);
    PayloadValue out = convertObject(v);
    active_.pop_back();
    return out;
  }

 private:
  PayloadValue convertObject(const rt::Value& v) {
    if (const auto* list = v.as<rt::ListObj>()) { return convertItems(list->items); }
    if (const auto* tuple = v.as<rt::TupleObj>()) { return convertItems(tuple->items); }
    if (const auto* set = v.as<rt::SetObj>()) { return convertItems(set->table.keys()); }
    if (const auto* dict = v.as<rt::DictObj>()) {
      PayloadValue::Map map;
      for (const auto& entry : dict->table.entries()) { map.emplace_back(rt::str(entry.key), convert(entry.value)); }
      return map;
    }
    if (const auto* result = v.as<SkillResultObj>()) {
      PayloadValue::Map map;
      map.emplace_back("stopped_reason", result->stoppedReason());
      map.emplace_back("data", convert(result->data()));
      map.emplace_back("actions_taken", result->actionsTaken());
      map.emplace_back("turns_elapsed", result->turnsElapsed());
      map.emplace_back("success", result->success());
      return map;
    }
    if (const auto* record = v.as<rt::RecordObj>()) {
      PayloadValue::Map map;
      for (const auto& [name, field] : record->fields()) { map.emplace_back(name, convert(field)); }
      return map;
    }
    return rt::repr(v);
  }

  PayloadValue convertItems(const rt::ValueList& items) {
    PayloadValue::List list;
    list.reserve(items.size());
    for (const auto& item : items) { list.push_back(convert(item)); }
    return list;
  }

  std::vector<const rt::Object*> active_{};
};

} // namespace

const PayloadValue* PayloadValue::find(const std::string& key) const {
  if (!isMap()) { return nullptr; }
  for (const auto& [k, v] : asMap()) {
    if (k == key) { return &v; }
  }
  return nullptr;
}

void PayloadValue::set(const std::string& key, PayloadValue value) {
  if (!isMap()) { v_ = Map{}; }
  for (auto& [k, v] : asMap()) {
    if (k == key) {
      v = std::move(value);
      return;
    }
  }
  asMap().emplace_back(key, std::move(value));
}

std::string PayloadValue::toJson() const {
  std::ostringstream oss;
  if (isNone()) {
    oss << "null";
  } else if (isBool()) {
    oss << (asBool() ? "true" : "false");
  } else if (isInt()) {
    oss << asInt();
  } else if (isFloat()) {
    oss << json::Number(asFloat());
  } else if (isString()) {
    oss << '"' << json::Escape(asString()) << '"';
  } else if (isList()) {
    oss << '[';
    bool first = true;
    for (const auto& item : asList()) {
      oss << (first ? "" : ", ") << item.toJson();
      first = false;
    }
    oss << ']';
  } else {
    oss << '{';
    bool first = true;
    for (const auto& [key, value] : asMap()) {
      oss << (first ? "" : ", ") << '"' << json::Escape(key) << "\": " << value.toJson();
      first = false;
    }
    oss << '}';
  }
  return oss.str();
}

std::string PayloadValue::toText() const {
  if (isNone()) { return "None"; }
  if (isBool()) { return asBool() ? "True" : "False"; }
  if (isInt()) { return std::to_string(asInt()); }
  if (isFloat()) { return rt::formatFloat(asFloat()); }
  if (isString()) { return rt::reprString(asString()); }
  std::string out;
  if (isList()) {
    out = "[";
    bool first = true;
    for (const auto& item : asList()) {
      out += (first ? "" : ", ") + item.toText();
      first = false;
    }
    return out + "]";
  }
  out = "{";
  bool first = true;
  for (const auto& [key, value] : asMap()) {
    out += (first ? "" : ", ") + rt::reprString(key) + ": " + value.toText();
    first = false;
  }
  return out + "}";
}

PayloadValue toPayload(const rt::Value& v) {
  Converter converter;
  return converter.convert(v);
}

rt::Value fromPayload(const PayloadValue& p) {
  if (p.isNone()) { return {}; }
  if (p.isBool()) { return rt::Value::boolean(p.asBool()); }
  if (p.isInt()) { return rt::Value::integer(p.asInt()); }
  if (p.isFloat()) { return rt::Value::real(p.asFloat()); }
  if (p.isString()) { return rt::newStr(p.asString()); }
  if (p.isList()) {
    rt::ValueList items;
    items.reserve(p.asList().size());
    for (const auto& item : p.asList()) { items.push_back(fromPayload(item)); }
    return rt::newList(std::move(items));
  }
  rt::Value dict = rt::newDict();
  auto& table = dict.as<rt::DictObj>()->table;
  for (const auto& [key, value] : p.asMap()) { table.insert(rt::newStr(key), fromPayload(value)); }
  return dict;
}

} // namespace pybox::sandbox
