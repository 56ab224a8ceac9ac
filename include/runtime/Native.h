/***
 * Name: pybox::rt::NativeObject
 * Purpose: Extension point for host-defined script types (domain models, records, the capability proxy).
 * Theory of Operation:
 *   A native object exposes exactly the attributes its getAttr() answers;
 *   there is no instance dictionary and no reflective access. Records are
 *   the generic read-only shape the capability handle returns; EnumMember
 *   backs enumerations such as Direction.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ast/BinaryOperator.h"
#include "runtime/Object.h"
#include "runtime/TypeObject.h"
#include "runtime/Value.h"

namespace pybox::rt {

class NativeObject : public Object {
 public:
  NativeObject() : Object(ObjKind::Native) {}

  virtual TypePtr type() const = 0;
  // `self` is this object wrapped as a value, for binding methods.
  virtual std::optional<Value> getAttr(Interpreter& interp, const Value& self, const std::string& name);
  // Returns false when the attribute cannot be assigned.
  virtual bool setAttr(const std::string& name, const Value& value);
  virtual std::vector<std::string> attrNames() const { return {}; }
  virtual std::string repr() const;
  virtual std::string str() const { return repr(); }
  virtual bool truthy() const { return true; }
  virtual bool equals(const NativeObject& other) const { return this == &other; }
  virtual std::size_t hash() const { return std::hash<const void*>{}(this); }
  // Arithmetic with `other`; `reflected` when this object is the right operand.
  // nullopt when unsupported.
  virtual std::optional<Value> binaryOp(ast::BinaryOperator op, const Value& other, bool reflected) const {
    (void)op;
    (void)other;
    (void)reflected;
    return std::nullopt;
  }
  // Three-way ordering; nullopt when the pair is unordered.
  virtual std::optional<int> compare(const NativeObject& other) const {
    (void)other;
    return std::nullopt;
  }
};

class EnumMember final : public NativeObject {
 public:
  EnumMember(TypePtr enumType, std::string name, Value value)
      : enumType_(std::move(enumType)), name_(std::move(name)), value_(std::move(value)) {}

  TypePtr type() const override { return enumType_; }
  std::optional<Value> getAttr(Interpreter& interp, const Value& self, const std::string& name) override;
  std::vector<std::string> attrNames() const override { return {"name", "value"}; }
  std::string repr() const override;
  std::string str() const override { return enumType_->name + "." + name_; }
  const std::string& name() const { return name_; }
  const Value& value() const { return value_; }
  void setExtra(std::string attr, Value v) { extras_.emplace_back(std::move(attr), std::move(v)); }
  void releaseReferences() override {
    enumType_.reset();
    value_ = Value();
    extras_.clear();
  }

 private:
  TypePtr enumType_;
  std::string name_;
  Value value_;
  std::vector<std::pair<std::string, Value>> extras_{};
};

// Read-only record with ordered fields; repr is "Name(field=value, ...)".
class RecordObj final : public NativeObject {
 public:
  RecordObj(TypePtr recordType, std::vector<std::pair<std::string, Value>> fields)
      : recordType_(std::move(recordType)), fields_(std::move(fields)) {}

  TypePtr type() const override { return recordType_; }
  std::optional<Value> getAttr(Interpreter& interp, const Value& self, const std::string& name) override;
  std::vector<std::string> attrNames() const override;
  std::string repr() const override;
  const std::vector<std::pair<std::string, Value>>& fields() const { return fields_; }
  const Value* field(const std::string& name) const;
  void releaseReferences() override { fields_.clear(); }

 private:
  TypePtr recordType_;
  std::vector<std::pair<std::string, Value>> fields_;
};

// Shared type object for records of one name (created per call site as needed).
TypePtr recordType(const std::string& name);

Value makeRecord(const std::string& typeName, std::vector<std::pair<std::string, Value>> fields);

} // namespace pybox::rt
