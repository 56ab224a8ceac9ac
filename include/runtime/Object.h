/***
 * Name: pybox::rt::Object
 * Purpose: Base of every heap-allocated interpreter object.
 */
#pragma once

namespace pybox::rt {

enum class ObjKind {
  Str,
  Bytes,
  List,
  Tuple,
  Dict,
  Set,
  Range,
  Slice,
  Iterator,
  Function,
  Builtin,
  Coroutine,
  Type,
  Exception,
  Module,
  Frame,
  Native
};

struct Object {
  explicit Object(const ObjKind k) : kind(k) {}
  virtual ~Object() = default;
  Object(const Object&) = delete;
  Object& operator=(const Object&) = delete;

  const ObjKind kind;

  // Drop every reference this object holds to other objects. Called on all
  // live objects when an interpreter is torn down so reference cycles die.
  virtual void releaseReferences() {}
};

} // namespace pybox::rt
