/***
 * Name: pybox::rt native objects (defaults, enum members, records)
 */
#include <memory>
#include <string>
#include <utility>

#include "runtime/Heap.h"
#include "runtime/Native.h"
#include "runtime/Ops.h"

namespace pybox::rt {

std::optional<Value> NativeObject::getAttr(Interpreter& interp, const Value& self, const std::string& name) {
  (void)interp;
  (void)self;
  (void)name;
  return std::nullopt;
}

bool NativeObject::setAttr(const std::string& name, const Value& value) {
  (void)name;
  (void)value;
  return false;
}

std::string NativeObject::repr() const { return "<" + type()->name + " object>"; }

std::optional<Value> EnumMember::getAttr(Interpreter& interp, const Value& self, const std::string& name) {
  (void)interp;
  (void)self;
  if (name == "name") { return newStr(name_); }
  if (name == "value") { return value_; }
  for (const auto& [k, v] : extras_) {
    if (k == name) { return v; }
  }
  return std::nullopt;
}

std::string EnumMember::repr() const { return "<" + enumType_->name + "." + name_ + ": " + rt::repr(value_) + ">"; }

std::optional<Value> RecordObj::getAttr(Interpreter& interp, const Value& self, const std::string& name) {
  (void)interp;
  (void)self;
  if (const Value* v = field(name)) { return *v; }
  return std::nullopt;
}

std::vector<std::string> RecordObj::attrNames() const {
  std::vector<std::string> out;
  out.reserve(fields_.size());
  for (const auto& [k, v] : fields_) { out.push_back(k); }
  return out;
}

std::string RecordObj::repr() const {
  std::string out = recordType_->name + "(";
  bool first = true;
  for (const auto& [k, v] : fields_) {
    if (!first) { out += ", "; }
    first = false;
    out += k + "=" + rt::repr(v);
  }
  return out + ")";
}

const Value* RecordObj::field(const std::string& name) const {
  for (const auto& [k, v] : fields_) {
    if (k == name) { return &v; }
  }
  return nullptr;
}

TypePtr recordType(const std::string& name) { return make<TypeObject>(name, builtinTypes().object); }

Value makeRecord(const std::string& typeName, std::vector<std::pair<std::string, Value>> fields) {
  return make<RecordObj>(recordType(typeName), std::move(fields));
}

} // namespace pybox::rt
