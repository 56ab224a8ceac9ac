/***
 * Name: pybox::sema policy lookups
 * Purpose: Table lookups behind the security walk.
 */
#include "sema/SecurityPolicy.h"

#include <algorithm>

namespace pybox::sema {

namespace {

template <typename Table>
bool contains(const Table& table, std::string_view name) {
  return std::find(table.begin(), table.end(), name) != table.end();
}

} // namespace

ImportVerdict classifyImport(std::string_view dottedName) {
  const std::string_view head = dottedName.substr(0, dottedName.find('.'));
  if (contains(kAllowedImports, head)) return ImportVerdict::Allowed;
  for (const auto prefix : kForbiddenModulePrefixes) {
    if (head.substr(0, prefix.size()) == prefix) return ImportVerdict::Forbidden;
  }
  return ImportVerdict::Unknown;
}

bool isForbiddenCall(std::string_view name) { return contains(kForbiddenCalls, name); }
bool isForbiddenMethod(std::string_view name) { return contains(kForbiddenMethods, name); }
bool isForbiddenAttribute(std::string_view name) { return contains(kForbiddenAttributes, name); }

} // namespace pybox::sema
